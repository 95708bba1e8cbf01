#pragma once
#include <algorithm>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <unistd.h>
#include <utility>

namespace ansifmt {
        // http://en.wikipedia.org/wiki/ANSI_escape_code
        static constexpr const char *bold      = "\033[1m";
        static constexpr const char *reset     = "\033[0m";
        static constexpr const char *color_red = "\033[31m";
} // namespace ansifmt

struct _srcline_repr final {
        uint32_t    line;
        const char *func;
        const char *file;

        _srcline_repr(const uint32_t l, const char *const f, const char *const _file)
            : line{l}
            , func{f}
            , file{_file} {
        }
};

#define srcline_repr() _srcline_repr(__LINE__, __FUNCTION__, __FILE__)

// human readable byte counts, for traces
struct size_repr final {
        const uint64_t v;

        size_repr(const uint64_t n)
            : v{n} {
        }
};

namespace SluicePrint {
        template <typename>
        inline constexpr bool no_print_impl = false;
}

template <typename A, typename B>
void PrintImpl(std::string &out, const std::pair<A, B> &pair);

inline void PrintImpl(std::string &out, const _srcline_repr &r) {
        const auto base = strrchr(r.file, '/');
        char       buf[32];
        const auto res = std::to_chars(buf, buf + sizeof(buf), r.line);

        out.push_back('<');
        out.append(base ? base + 1 : r.file);
        out.push_back(':');
        out.append(buf, res.ptr);
        out.push_back(' ');
        out.append(r.func);
        out.append("> ");
}

inline void PrintImpl(std::string &out, const size_repr &r) {
        static constexpr const char *units[] = {"b", "kb", "mb", "gb", "tb"};
        double                       v       = r.v;
        unsigned                     i{0};
        char                         buf[64];

        while (v >= 1024 && i + 1 < sizeof(units) / sizeof(units[0])) {
                v /= 1024;
                ++i;
        }

        out.append(buf, i ? snprintf(buf, sizeof(buf), "%.2lf%s", v, units[i])
                          : snprintf(buf, sizeof(buf), "%u%s", static_cast<unsigned>(r.v), units[0]));
}

template <typename T>
void PrintImpl(std::string &out, const T &v) {
        if constexpr (std::is_same_v<T, bool>) {
                out.append(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, char>) {
                out.push_back(v);
        } else if constexpr (std::is_enum_v<T>) {
                // 'naked' enums are printed as their underlying value
                PrintImpl(out, static_cast<uint64_t>(v));
        } else if constexpr (std::is_integral_v<T>) {
                char       buf[32];
                const auto res = std::to_chars(buf, buf + sizeof(buf), v);

                out.append(buf, res.ptr);
        } else if constexpr (std::is_floating_point_v<T>) {
                char       buf[64];
                const auto n = snprintf(buf, sizeof(buf), "%lf", static_cast<double>(v));

                if (n > 0) {
                        // snprintf() returns the untruncated length
                        out.append(buf, std::min<size_t>(n, sizeof(buf) - 1));
                }
        } else if constexpr (std::is_same_v<T, const char *> || std::is_same_v<T, char *>) {
                out.append(v ? v : "(nullptr)");
        } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
                out.append(std::string_view(v));
        } else if constexpr (std::is_pointer_v<T>) {
                char buf[32];

                out.append(buf, snprintf(buf, sizeof(buf), "%p", static_cast<const void *>(v)));
        } else {
                static_assert(SluicePrint::no_print_impl<T>, "PrintImpl() specialization for type not defined");
        }
}

template <typename A, typename B>
void PrintImpl(std::string &out, const std::pair<A, B> &pair) {
        out.push_back('<');
        PrintImpl(out, pair.first);
        out.append(", ");
        PrintImpl(out, pair.second);
        out.push_back('>');
}

template <typename... Args>
void ToBuffer(std::string &out, const Args &... args) {
        (PrintImpl(out, args), ...);
}

inline std::string &thread_local_buf() {
        static thread_local std::string b;

        return b;
}

template <typename... Args>
void Print(const Args &... args) {
        auto &b = thread_local_buf();

        b.clear();
        ToBuffer(b, args...);

        const auto r = write(STDOUT_FILENO, b.data(), b.size());

        (void)r; // (void)write triggers warning if -Wunused-result is set
}

#define SLog(...) ::Print(srcline_repr(), __VA_ARGS__)
