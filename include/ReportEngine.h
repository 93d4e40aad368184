#pragma once
#include <string>
#include <vector>

class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addSection(const std::string& heading);
    void addParagraph(const std::string& text);
    void addBullets(const std::vector<std::string>& items);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);
    void addImage(const std::string& title, const std::string& imagePath);

    /**
     * @brief Writes the markdown body; local image links are rewritten relative to the report's directory.
     * @throws Sandy::IOException if the file cannot be written.
     */
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
