#include "bundle_validation/archive_bridge.hpp"
#include "bundle_validation/scoped_environment.hpp"
#include "bundle_validation/subprocess.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace bundle::validation::archive_bridge {

static fs::path make_unique_file(const fs::path& base, const std::string& prefix, unsigned seq) {
    auto now = std::chrono::system_clock::now();
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    std::ostringstream os;
    os << prefix << since_epoch << '_' << seq << ".txt";
    return base / os.str();
}

std::vector<std::string> split_command(const std::string& command_line) {
    std::vector<std::string> out;
    std::string word;
    bool in_word = false;
    char quote = '\0';

    for (std::size_t i = 0; i < command_line.size(); ++i) {
        const char ch = command_line[i];
        if (quote != '\0') {
            if (ch == quote) {
                quote = '\0';
            } else if (ch == '\\' && quote == '"' && i + 1 < command_line.size() &&
                       (command_line[i + 1] == '"' || command_line[i + 1] == '\\')) {
                word += command_line[++i];
            } else {
                word += ch;
            }
        } else if (ch == '\'' || ch == '"') {
            quote = ch;
            in_word = true;
        } else if (ch == '\\' && i + 1 < command_line.size() &&
                   (command_line[i + 1] == '"' || command_line[i + 1] == '\'' || command_line[i + 1] == ' ')) {
            // Backslashes elsewhere stay literal so Windows paths survive.
            word += command_line[++i];
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(ch))) {
            if (in_word) {
                out.push_back(std::move(word));
                word.clear();
                in_word = false;
            }
        } else {
            word += ch;
            in_word = true;
        }
    }

    if (quote != '\0') {
        throw std::runtime_error("Unterminated quote in command: " + command_line);
    }
    if (in_word) {
        out.push_back(std::move(word));
    }
    return out;
}

Session::Session(Config cfg) : cfg_(std::move(cfg)) {}

bool Session::init(std::string& diag_out) {
    if (ready_) return true;

    if (cfg_.command.empty()) {
        diag_out += "No lister command configured\n";
        return false;
    }

    const auto search_path = get_variable("PATH").value_or("");
    const auto found = find_program(cfg_.command.front(), search_path);
    if (!found) {
        diag_out += "Lister executable not found: " + cfg_.command.front() + "\n";
        return false;
    }
    resolved_ = fs::absolute(*found);

    std::error_code ec;
    work_root_ = cfg_.work_dir.empty() ? fs::temp_directory_path(ec) : fs::absolute(cfg_.work_dir);
    if (ec) {
        diag_out += "No temporary directory available: " + ec.message() + "\n";
        return false;
    }
    fs::create_directories(work_root_, ec);
    if (ec) {
        diag_out += "Failed to create work_dir: " + work_root_.string() + " : " + ec.message() + "\n";
        return false;
    }

    ready_ = true;
    return true;
}

std::vector<std::string> Session::list(const fs::path& artifact) const {
    if (!ready_) {
        throw std::runtime_error("Archive lister used before init()");
    }

    const fs::path output = make_unique_file(work_root_, "listing_", sequence_++);

    ProcessSpec spec;
    spec.executable = resolved_;
    spec.argv = cfg_.command;
    spec.argv.push_back(fs::absolute(artifact).string());
    spec.stdout_path = output;

    const int rc = run_subprocess(spec);
    if (rc != 0) {
        std::error_code ec;
        fs::remove(output, ec);
        throw std::runtime_error("Listing " + artifact.string() + " failed, rc=" + std::to_string(rc));
    }

    std::ifstream ifs(output, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open listing output: " + output.string());
    }

    std::vector<std::string> names;
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            names.push_back(std::move(line));
        }
    }
    ifs.close();

    std::error_code ec;
    fs::remove(output, ec);
    return names;
}

} // namespace bundle::validation::archive_bridge
