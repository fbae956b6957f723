#pragma once
#include <mutex>
#include <ostream>
#include <string>

namespace pw {
// Shared stdout for all probe loops. Each write() lands as one unit, so lines
// from different targets interleave but never tear.
class Console {
   public:
    explicit Console(std::ostream& out) : out_(out) {}
    void write(const std::string& text) {
        std::lock_guard<std::mutex> lk(mu_);
        out_ << text;
        out_.flush();
    }
    void write_line(const std::string& line) { write(line + "\n"); }

   private:
    std::mutex mu_;
    std::ostream& out_;
};
}  // namespace pw
