#include "ReportEngine.h"
#include "AcMapExceptions.h"

#include <fstream>

namespace {
std::string escapeCell(const std::string& value) {
    std::string out;
    for (char ch : value) {
        switch (ch) {
            case '|': out += "\\|"; break;
            case '\n': out += "<br>"; break;
            case '\r': break;
            default: out.push_back(ch); break;
        }
    }
    return out;
}

std::string tableRow(const std::vector<std::string>& cells, size_t width) {
    std::string row = "|";
    for (size_t i = 0; i < width; ++i) {
        row += " " + (i < cells.size() ? escapeCell(cells[i]) : std::string()) + " |";
    }
    return row + "\n";
}

std::string linkTarget(const std::string& path, const std::filesystem::path& reportDir) {
    if (reportDir.empty() || path.empty()) return path;
    std::error_code ec;
    const auto rel = std::filesystem::relative(std::filesystem::absolute(path, ec), reportDir, ec);
    return (ec || rel.empty()) ? path : rel.generic_string();
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    text_ += "# " + title + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    text_ += text + "\n\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    text_ += "## " + title + "\n";
    if (headers.empty()) {
        text_ += "(no columns)\n\n";
        return;
    }
    text_ += tableRow(headers, headers.size());
    text_ += tableRow(std::vector<std::string>(headers.size(), "---"), headers.size());
    for (const auto& row : rows) text_ += tableRow(row, headers.size());
    text_ += "\n";
}

void ReportEngine::addImage(const std::string& title, const std::string& imagePath) {
    images_.push_back({text_.size(), title, imagePath});
}

std::string ReportEngine::render(const std::filesystem::path& reportDir) const {
    std::string out;
    size_t cursor = 0;
    for (const auto& img : images_) {
        out.append(text_, cursor, img.offset - cursor);
        out += "### " + img.title + "\n";
        out += "![" + img.title + "](" + linkTarget(img.path, reportDir) + ")\n\n";
        cursor = img.offset;
    }
    out.append(text_, cursor, std::string::npos);
    return out;
}

void ReportEngine::save(const std::string& filePath) const {
    std::error_code ec;
    std::filesystem::path reportDir = std::filesystem::absolute(filePath, ec).parent_path();
    if (ec) reportDir.clear();

    std::ofstream out(filePath);
    if (!out) {
        throw AcMap::IOException("Unable to open report file: " + filePath);
    }
    out << render(reportDir);
    if (!out) {
        throw AcMap::IOException("Failed while writing report file: " + filePath);
    }
}
