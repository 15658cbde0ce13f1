#ifndef MACSWEEP_UTILS_HPP
#define MACSWEEP_UTILS_HPP

#include <cctype>
#include <string_view>
#include <utility>

template <typename F>
class Finally {
  private:
    F fin_;

  public:
    explicit Finally(F&& fin) : fin_(std::forward<F>(fin)) {}

    ~Finally() {
        fin_();
    }

    Finally(const Finally&) = delete;
    Finally(Finally&&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally& operator=(Finally&&) = delete;
};

template <typename F>
Finally<F> finally(F&& fin) {
    return Finally<F>(std::forward<F>(fin));
}

inline std::string_view trim_front(std::string_view s) noexcept {
    size_t pos = 0;
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
        ++pos;
    }
    return s.substr(pos);
}

inline std::string_view trim_back(std::string_view s) noexcept {
    size_t pos = s.size();
    while (pos > 0 && std::isspace(static_cast<unsigned char>(s[pos-1]))) {
        --pos;
    }
    return s.substr(0, pos);
}

inline std::string_view trim(std::string_view s) noexcept {
    return trim_back(trim_front(s));
}

// Splits at the first occurrence of any character in `chars`.
inline std::pair<std::string_view, std::string_view>
split(std::string_view s, std::string_view chars) noexcept {
    auto pos = s.find_first_of(chars);
    if (pos == std::string_view::npos) {
        return {s, std::string_view{}};
    } else {
        return {s.substr(0, pos), s.substr(pos + 1)};
    }
}

#endif
