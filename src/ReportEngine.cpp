#include "ReportEngine.h"
#include "SandyExceptions.h"

#include <filesystem>
#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

std::string escapeHtml(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (char ch : value) {
        switch (ch) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\n': escaped += "<br>"; break;
            case '\r': break;
            default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 120;
constexpr size_t kWideTableColumns = 10;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

void appendWideHtmlTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "<div style=\"overflow-x:auto; max-width:100%;\">\n<table>\n  <thead>\n    <tr>\n";
    for (const auto& h : headers) {
        body += "      <th>" + escapeHtml(h) + "</th>\n";
    }
    body += "    </tr>\n  </thead>\n  <tbody>\n";
    for (const auto& row : rows) {
        body += "    <tr>\n";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += "      <td>" + escapeHtml(i < row.size() ? row[i] : "") + "</td>\n";
        }
        body += "    </tr>\n";
    }
    body += "  </tbody>\n</table>\n</div>\n\n";
}

void appendTable(std::string& body,
                 const std::vector<std::string>& headers,
                 const std::vector<std::vector<std::string>>& rows) {
    if (headers.size() >= kWideTableColumns) {
        appendWideHtmlTable(body, headers, rows);
    } else {
        appendMarkdownTable(body, headers, rows);
    }
}

bool isRemoteOrAnchorLink(const std::string& target) {
    if (target.empty() || target[0] == '#') return true;
    const size_t colon = target.find(':');
    const size_t slash = target.find('/');
    return colon != std::string::npos && colon > 1 && (slash == std::string::npos || colon < slash);
}

// Image paths are produced relative to the working directory; the report may live elsewhere.
std::string relinkForReport(const std::string& target, const std::filesystem::path& reportDir) {
    if (isRemoteOrAnchorLink(target)) return target;

    std::error_code ec;
    const std::filesystem::path absolute = std::filesystem::absolute(target, ec);
    if (ec) return target;
    const std::filesystem::path rel = std::filesystem::relative(absolute, reportDir, ec);
    if (ec || rel.empty()) return target;
    return rel.generic_string();
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBullets(const std::vector<std::string>& items) {
    if (items.empty()) return;
    for (const auto& item : items) {
        body_ += "- " + item + "\n";
    }
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (tallTable) {
        body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    }

    const size_t previewCount = tallTable ? kTallTableRowCap : rows.size();
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(previewCount));
    appendTable(body_, headers, previewRows);

    if (tallTable) {
        body_ += "<details>\n";
        body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
        appendTable(body_, headers, rows);
        body_ += "</details>\n\n";
    }
}

void ReportEngine::addImage(const std::string& title, const std::string& imagePath) {
    body_ += "### " + title + "\n";
    body_ += "![" + title + "](" + imagePath + ")\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::error_code ec;
    const std::filesystem::path parent = std::filesystem::path(filePath).parent_path();
    const std::filesystem::path reportDir = std::filesystem::absolute(parent.empty() ? "." : parent, ec);

    std::string out;
    out.reserve(body_.size() + 64);
    size_t cursor = 0;
    while (true) {
        const size_t start = body_.find("](", cursor);
        const size_t end = start == std::string::npos ? std::string::npos : body_.find(')', start + 2);
        if (end == std::string::npos) {
            out.append(body_, cursor, std::string::npos);
            break;
        }
        out.append(body_, cursor, start + 2 - cursor);
        const std::string target = body_.substr(start + 2, end - start - 2);
        out += ec ? target : relinkForReport(target, reportDir);
        out.push_back(')');
        cursor = end + 1;
    }

    std::ofstream file(filePath);
    if (!file) throw Sandy::IOException("Could not write report: " + filePath);
    file << out;
    if (!file.good()) throw Sandy::IOException("Failed while writing report: " + filePath);
}
