#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace rehost {

class Context {
public:
    explicit Context(bool verbose = true) : verbose_(verbose) {}

    // Mirrors every line into a run log file in addition to the console.
    Context withLogFile(const std::string &path) const {
        Context out(verbose_);
        out.mirror_ = std::make_shared<std::ofstream>(path, std::ios::app);
        out.prefix_ = prefix_;
        return out;
    }

    Context withPrefix(const std::string &prefix) const {
        Context out(*this);
        out.prefix_ = prefix;
        return out;
    }

    template <typename... Args>
    void log(const Args &...args) const {
        emit(std::cout, "", args...);
    }

    template <typename... Args>
    void debug(const Args &...args) const {
        if (verbose_) {
            emit(std::cout, "[debug] ", args...);
        }
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        emit(std::cerr, "[warn] ", args...);
    }

    template <typename... Args>
    void error(const Args &...args) const {
        emit(std::cerr, "[error] ", args...);
    }

    bool verbose() const { return verbose_; }

private:
    template <typename... Args>
    void emit(std::ostream &stream, const char *level, const Args &...args) const {
        std::ostringstream line;
        line << level;
        if (!prefix_.empty()) {
            line << '[' << prefix_ << "] ";
        }
        (line << ... << args);

        std::lock_guard<std::mutex> lock(outputMutex());
        stream << line.str() << '\n';
        if (mirror_ && mirror_->is_open()) {
            *mirror_ << line.str() << '\n';
            mirror_->flush();
        }
    }

    static std::mutex &outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    bool verbose_;
    std::string prefix_;
    std::shared_ptr<std::ofstream> mirror_;
};

} // namespace rehost
