#include "log_buffer.hpp"
#include <fstream>

std::string LogBuffer::text() const {
    std::string out;
    for (const auto& line : lines_) {
        out += line;
        out += '\n';
    }
    return out;
}

std::string LogBuffer::tail(size_t n) const {
    size_t start = lines_.size() > n ? lines_.size() - n : 0;
    std::string out;
    for (size_t i = start; i < lines_.size(); i++) {
        if (i > start) out += '\n';
        out += lines_[i];
    }
    return out;
}

Result<void> LogBuffer::save_to(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err("Cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write " + path.string());
    }
    out << text();
    if (!out) {
        return Result<void>::Err("Write failed for " + path.string());
    }
    return Result<void>::Ok();
}
