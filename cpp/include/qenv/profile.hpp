#pragma once

#include <chrono>
#include <cstdio>
#include <ostream>
#include <string>
#include <utility>

namespace qenv::profile {

// Wall-clock seconds since construction or the last reset().
class Stopwatch {
  public:
    Stopwatch() : start_(clock::now()) {}

    void reset() { start_ = clock::now(); }
    double seconds() const {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

  private:
    using clock = std::chrono::steady_clock;
    clock::time_point start_;
};

// Indented timing report written as each section closes:
//   auto total = session.section("Total");
//   { auto s = session.section("Build environment"); ... }
// A disabled session prints nothing.
class Session {
  public:
    class Section {
      public:
        Section(const Section&) = delete;
        Section& operator=(const Section&) = delete;
        ~Section() {
            if (!session_) return;
            --session_->depth_;
            session_->report(depth_, name_, watch_.seconds());
        }

      private:
        friend class Session;
        Section(Session* session, std::string name) : session_(session), name_(std::move(name)) {
            if (session_) depth_ = session_->depth_++;
        }

        Session* session_;
        std::string name_;
        int depth_{0};
        Stopwatch watch_;
    };

    Session(bool enabled, std::ostream& os) : enabled_(enabled), os_(os) {}

    bool enabled() const noexcept { return enabled_; }

    // Returned by value; C++17 elides the copy, so the section lives in the caller's scope.
    Section section(std::string name) { return Section(enabled_ ? this : nullptr, std::move(name)); }

  private:
    void report(int depth, const std::string& name, double seconds) {
        char ms[32];
        std::snprintf(ms, sizeof(ms), "%.3f", seconds * 1e3);
        os_ << std::string(static_cast<std::size_t>(depth) * 2U, ' ') << name << ": " << ms << " ms\n";
    }

    bool enabled_;
    std::ostream& os_;
    int depth_{0};
};

} // namespace qenv::profile
