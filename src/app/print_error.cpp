#include "pyhost/app/Runner.h"
#include "pyhost/exceptions/foreign_error.h"

#include <unistd.h>

#include <sstream>
#include <string>
#include <string_view>

namespace pyhost {
    static void write_str(const std::string_view strView) {
        std::size_t done = 0;
        while (done < strView.size()) {
            const auto n = ::write(2, strView.data() + done, strView.size() - done);
            if (n <= 0) { return; }
            done += static_cast<std::size_t>(n);
        }
    }

    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kDim = "\033[2m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_label(const bool color) {
        write_str("pyhost: ");
        if (color) {
            write_str(kRed);
            write_str("error: ");
            write_str(kReset);
        } else { write_str("error: "); }
    }

    static void print_message(const exceptions::ForeignError &err, const bool color) {
        if (color) { write_str(kBold); }
        write_str("[");
        write_str(err.typeName());
        write_str("]");
        if (color) { write_str(kReset); }
        write_str(" ");
        write_str(err.text());
        write_str("\n");
    }

    static void print_stack(const exceptions::ForeignError &err, const bool color) {
        for (const auto &frame : err.stack()) {
            std::ostringstream line;
            line << frame << "\n";
            const bool foreign = frame.line > 0;
            if (color && !foreign) { write_str(kDim); }
            write_str(line.str());
            if (color && !foreign) { write_str(kReset); }
        }
    }

    void Runner::print_error(const exceptions::ForeignError &err, const bool color) {
        print_label(color);
        print_message(err, color);
        print_stack(err, color);
    }
} // namespace pyhost
