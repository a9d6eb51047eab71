#include "GnuplotEngine.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <spawn.h>
#include <sstream>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace {
std::optional<std::filesystem::path> locateGnuplot() {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return std::nullopt;

    std::string_view rest(pathEnv);
    while (true) {
        const size_t colon = rest.find(':');
        const std::string_view dir = rest.substr(0, colon);
        const std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : std::string(dir)) / "gnuplot";
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (colon == std::string_view::npos) break;
        rest.remove_prefix(colon + 1);
    }
    return std::nullopt;
}

// Owns a posix_spawn_file_actions_t for the lifetime of one spawn.
class SpawnActions {
public:
    SpawnActions() { ok_ = ::posix_spawn_file_actions_init(&actions_) == 0; }
    ~SpawnActions() {
        if (ok_) ::posix_spawn_file_actions_destroy(&actions_);
    }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    bool redirectStderr(const std::string& path) {
        return ok_ && ::posix_spawn_file_actions_addopen(&actions_, STDERR_FILENO, path.c_str(),
                                                         O_CREAT | O_WRONLY | O_TRUNC, 0644) == 0;
    }
    const posix_spawn_file_actions_t* get() const { return &actions_; }

private:
    posix_spawn_file_actions_t actions_{};
    bool ok_ = false;
};

// Returns gnuplot's exit status, or -1 when it could not be run to completion.
int spawnGnuplot(const std::filesystem::path& executable, const std::string& scriptPath, const std::string& stderrPath) {
    SpawnActions actions;
    if (!actions.redirectStderr(stderrPath)) return -1;

    const std::string exe = executable.string();
    std::vector<char*> argv{const_cast<char*>(exe.c_str()), const_cast<char*>(scriptPath.c_str()), nullptr};
    pid_t pid = -1;
    if (::posix_spawn(&pid, exe.c_str(), actions.get(), nullptr, argv.data(), environ) != 0 || pid <= 0) {
        return -1;
    }

    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
    return static_cast<bool>(out);
}

struct Palette {
    const char* title;
    const char* border;
    const char* tics;
    const char* background;
};

constexpr Palette kLightPalette{"#1f2937", "#9ca3af", "#374151", "#ffffff"};
constexpr Palette kDarkPalette{"#f9fafb", "#6b7280", "#e5e7eb", "#111827"};
} // namespace

std::string GnuplotEngine::sanitizeId(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    for (unsigned char c : id) {
        out.push_back((std::isalnum(c) || c == '_' || c == '-') ? static_cast<char>(c) : '_');
    }
    return out.empty() ? "plot" : out;
}

std::string GnuplotEngine::quoteForGnuplot(const std::string& value) {
    std::string escaped = "'";
    for (char ch : value) {
        escaped += (ch == '\'') ? std::string("''") : std::string(1, ch);
    }
    return escaped + "'";
}

// Data-file strings are double quoted; embedded quotes and line breaks would split the record.
std::string GnuplotEngine::quoteDataString(const std::string& value) {
    std::string escaped = "\"";
    for (char ch : value) {
        switch (ch) {
            case '"': escaped.push_back('\''); break;
            case '\n':
            case '\r':
            case '\t': escaped.push_back(' '); break;
            default: escaped.push_back(ch); break;
        }
    }
    return escaped + "\"";
}

std::string GnuplotEngine::terminalForFormat(const std::string& format, int width, int height) {
    const std::string size = std::to_string(width) + "," + std::to_string(height);
    if (format == "svg") return "svg size " + size;
    if (format == "pdf") return "pdfcairo size 11in,8in";
    return "pngcairo size " + size;
}

std::string GnuplotEngine::outputPath(const std::string& id) const {
    return assetsDir_ + "/" + sanitizeId(id) + "." + cfg_.format;
}

std::string GnuplotEngine::dataPath(const std::string& id) const {
    return assetsDir_ + "/" + sanitizeId(id) + ".dat";
}

std::string GnuplotEngine::styledHeader(const std::string& id, const std::string& title) const {
    const Palette& p = (cfg_.theme == "dark") ? kDarkPalette : kLightPalette;

    std::ostringstream script;
    script << "set terminal " << terminalForFormat(cfg_.format, cfg_.width, cfg_.height)
           << " enhanced background rgb " << quoteForGnuplot(p.background) << "\n"
           << "set output " << quoteForGnuplot(outputPath(id)) << "\n"
           << "set title " << quoteForGnuplot(title) << " noenhanced tc rgb " << quoteForGnuplot(p.title)
           << " font ',14'\n"
           << "set border linewidth " << cfg_.lineWidth << " lc rgb " << quoteForGnuplot(p.border) << "\n"
           << "set tics out nomirror textcolor rgb " << quoteForGnuplot(p.tics) << " font ',10'\n"
           // 1: series line, 2: tree edges, 3: tree nodes
           << "set style line 1 lc rgb '#2563eb' lw " << cfg_.lineWidth << " pt 7 ps " << cfg_.pointSize << "\n"
           << "set style line 2 lc rgb '#6b7280' lw " << cfg_.lineWidth << "\n"
           << "set style line 3 lc rgb '#f59e0b' pt 7 ps " << (cfg_.pointSize * 3.0) << "\n";
    return script.str();
}

GnuplotEngine::GnuplotEngine(std::string assetsDir, PlotConfig cfg)
    : assetsDir_(std::move(assetsDir)), cfg_(std::move(cfg)) {
    std::error_code ec;
    std::filesystem::create_directories(assetsDir_, ec);
    if (ec) {
        std::cerr << "[AcMap][Plot] Could not create assets directory '" << assetsDir_ << "': " << ec.message() << "\n";
    }
}

bool GnuplotEngine::isAvailable() const {
    return locateGnuplot().has_value();
}

std::string GnuplotEngine::runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent) {
    const auto gnuplot = locateGnuplot();
    if (!gnuplot) return "";

    const std::string stem = assetsDir_ + "/" + sanitizeId(id);
    const std::string dataFile = dataPath(id);
    const std::string scriptFile = stem + ".plt";
    const std::string errFile = stem + ".err.log";
    const std::string outputFile = outputPath(id);

    int rc = -1;
    if (writeTextFile(dataFile, dataContent) && writeTextFile(scriptFile, scriptContent)) {
        rc = spawnGnuplot(*gnuplot, scriptFile, errFile);
    }

    std::error_code ec;
    std::filesystem::remove(dataFile, ec);
    std::filesystem::remove(scriptFile, ec);

    if (rc == 0 && std::filesystem::exists(outputFile, ec)) {
        std::filesystem::remove(errFile, ec);
        return outputFile;
    }

    std::string firstLine;
    std::ifstream errIn(errFile);
    std::getline(errIn, firstLine);
    std::cerr << "[AcMap][Plot] Generation failed for id='" << sanitizeId(id) << "' rc=" << rc
              << " output='" << outputFile << "'";
    if (!firstLine.empty()) std::cerr << " stderr='" << firstLine << "'";
    std::cerr << " full_log='" << errFile << "'\n";
    return "";
}

std::string GnuplotEngine::graphData(const std::vector<GraphNode>& nodes, const std::vector<GraphEdge>& edges) {
    std::ostringstream data;
    data << std::setprecision(10);
    // index 0: edges as x1 y1 x2 y2 "label"
    for (const auto& e : edges) {
        if (e.from >= nodes.size() || e.to >= nodes.size()) continue;
        const GraphNode& a = nodes[e.from];
        const GraphNode& b = nodes[e.to];
        data << a.x << " " << a.y << " " << b.x << " " << b.y << " " << quoteDataString(e.label) << "\n";
    }
    if (edges.empty()) data << "0 0 0 0 \"\"\n";
    data << "\n\n";
    // index 1: nodes as x y "label"
    for (const auto& n : nodes) {
        data << n.x << " " << n.y << " " << quoteDataString(n.label) << "\n";
    }
    return data.str();
}

std::string GnuplotEngine::graphScript(const std::string& id, const std::string& title) const {
    const std::string data = quoteForGnuplot(dataPath(id));

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "unset border\nunset tics\nunset key\nunset grid\n";
    script << "set offsets graph 0.12, graph 0.12, graph 0.15, graph 0.15\n";
    script << "plot " << data << " index 0 using 1:2:($3-$1):($4-$2) with vectors nohead ls 2, \\\n";
    script << "     '' index 0 using (($1+$3)/2):(($2+$4)/2):5 with labels noenhanced font ',8' tc rgb '#6b7280', \\\n";
    script << "     '' index 1 using 1:2 with points ls 3, \\\n";
    script << "     '' index 1 using 1:2:3 with labels noenhanced offset 0,1.6 font ',11'\n";
    return script.str();
}

std::string GnuplotEngine::graph(const std::string& id,
                                 const std::vector<GraphNode>& nodes,
                                 const std::vector<GraphEdge>& edges,
                                 const std::string& title) {
    if (nodes.empty()) return "";
    return runScript(id, graphData(nodes, edges), graphScript(id, title));
}

std::string GnuplotEngine::heatmap(const std::string& id,
                                   const std::vector<std::vector<double>>& matrix,
                                   const std::string& title,
                                   const std::vector<std::string>& labels) {
    if (matrix.empty() || matrix.front().empty()) return "";

    std::ostringstream data;
    data << std::setprecision(10);
    for (size_t r = 0; r < matrix.size(); ++r) {
        for (size_t c = 0; c < matrix[r].size(); ++c) {
            data << c << " " << r << " " << matrix[r][c] << "\n";
        }
        data << "\n";
    }

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "set view map\nunset key\n";
    script << "set palette defined (0 '#f3f4f6', 0.5 '#60a5fa', 1 '#1e3a8a')\n";
    script << "set autoscale cbfix\nset yrange [] reverse\n";
    if (!labels.empty() && labels.size() == matrix.size()) {
        script << "set xtics (";
        for (size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) script << ", ";
            script << quoteForGnuplot(labels[i]) << " " << i;
        }
        script << ") noenhanced rotate by -35 font ',9'\n";
        script << "set ytics (";
        for (size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) script << ", ";
            script << quoteForGnuplot(labels[i]) << " " << i;
        }
        script << ") noenhanced font ',9'\n";
    }
    script << "plot " << quoteForGnuplot(dataPath(id)) << " using 1:2:3 with image\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::line(const std::string& id,
                                const std::vector<double>& x,
                                const std::vector<double>& y,
                                const std::string& title,
                                const std::string& xLabel,
                                const std::string& yLabel) {
    if (x.empty() || x.size() != y.size()) return "";

    std::ostringstream data;
    data << std::setprecision(12);
    for (size_t i = 0; i < x.size(); ++i) {
        data << x[i] << " " << y[i] << "\n";
    }

    std::ostringstream script;
    script << styledHeader(id, title);
    if (cfg_.showGrid) script << "set grid back lc rgb '#e5e7eb' lw 1 dt 2\n";
    script << "unset key\n";
    if (!xLabel.empty()) script << "set xlabel " << quoteForGnuplot(xLabel) << " noenhanced\n";
    if (!yLabel.empty()) script << "set ylabel " << quoteForGnuplot(yLabel) << " noenhanced\n";
    script << "plot " << quoteForGnuplot(dataPath(id)) << " using 1:2 with lines ls 1\n";
    return runScript(id, data.str(), script.str());
}
