#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "backend.hpp"
#include "formatter.hpp"

namespace relaylog {

// One line per emit. The stream must outlive the sink.
inline LogSink stream_sink(std::ostream& out) {
    auto mutex = std::make_shared<std::mutex>();
    return [&out, mutex](const std::string& line) {
        std::lock_guard<std::mutex> lock(*mutex);
        out << line << '\n';
    };
}

// Append-only log file
class FileSink {
public:
    explicit FileSink(std::string filename)
        : filename_(std::move(filename)) {
        file_.open(filename_, std::ios::app);
        if (!file_) {
            throw std::runtime_error("Cannot open log file: " + filename_);
        }
    }

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    const std::string& filename() const noexcept { return filename_; }

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_ << line << '\n' << std::flush;
    }

private:
    std::string filename_;
    std::ofstream file_;
    std::mutex mutex_;
};

inline std::shared_ptr<Backend> make_stream_backend(std::ostream& out,
                                                    BackendConfig config = BackendConfig()) {
    return std::make_shared<Backend>(stream_sink(out), std::move(config));
}

// Colored output with the ANSI formatter
inline BackendConfig console_config() {
    BackendConfig config;
    config.formatter = make_ansi_formatter();
    config.styled = true;
    return config;
}

inline std::shared_ptr<Backend> make_console_backend(BackendConfig config = console_config()) {
    return make_stream_backend(std::clog, std::move(config));
}

// File backend; never styled since escape codes would end up in the file
inline std::shared_ptr<Backend> make_file_backend(const std::string& filename,
                                                  BackendConfig config = BackendConfig()) {
    auto file = std::make_shared<FileSink>(filename);
    config.sink_supports_styling = false;
    return std::make_shared<Backend>(
        [file](const std::string& line) { file->write(line); }, std::move(config));
}

} // namespace relaylog
