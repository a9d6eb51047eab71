#pragma once
#include <filesystem>
#include <string>
#include <vector>

// Markdown report assembled block by block and written in one go.
class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addParagraph(const std::string& text);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);
    void addImage(const std::string& title, const std::string& imagePath);

    /**
     * @brief Writes the report; image links are rewritten relative to its folder.
     * @throws AcMap::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

    // Markdown with image paths left as given.
    std::string body() const { return render({}); }

private:
    struct Image {
        size_t offset;
        std::string title;
        std::string path;
    };

    std::string render(const std::filesystem::path& reportDir) const;

    std::string text_;
    std::vector<Image> images_;
};
