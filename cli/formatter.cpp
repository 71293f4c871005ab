//
// Created by gregorian-rayne on 1/20/26.
//

#include "sdkir/cli/formatter.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <cstdio>

namespace sdkir::cli {

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    std::string format_count(const std::size_t count) {
        std::string result = std::to_string(count);

        auto insert_pos = static_cast<std::ptrdiff_t>(result.length()) - 3;
        while (insert_pos > 0) {
            result.insert(static_cast<std::size_t>(insert_pos), ",");
            insert_pos -= 3;
        }

        return result;
    }

    // ============================================================================
    // Table
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        row.resize(std::max(row.size(), columns_.size()));
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::clear() {
        rows_.clear();
        separators_.clear();
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width != 0) {
                continue;
            }
            std::size_t max_width = columns_[i].header.length();
            for (const auto& row : rows_) {
                if (i < row.size()) {
                    max_width = std::max(max_width, row[i].length());
                }
            }
            columns_[i].width = max_width;
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table sized = *this;
        sized.calculate_widths();
        const bool use_colors = colors::enabled();

        const auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < sized.columns_.size(); ++i) {
                const auto& col = sized.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width) {
                    cell = col.width > 3 ? cell.substr(0, col.width - 3) + "..." : cell.substr(0, col.width);
                }

                const char* color = nullptr;
                if (use_colors) {
                    if (is_header) {
                        color = colors::BOLD;
                    } else if (col.color) {
                        color = col.color->c_str();
                    }
                }

                if (color) out << color;
                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }
                if (color) out << colors::RESET;

                if (i + 1 < sized.columns_.size()) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        const auto render_separator = [&] {
            for (std::size_t i = 0; i < sized.columns_.size(); ++i) {
                out << std::string(sized.columns_[i].width, '-');
                if (i + 1 < sized.columns_.size()) {
                    out << "--";
                }
            }
            out << "\n";
        };

        Row header;
        for (const auto& col : sized.columns_) {
            header.push_back(col.header);
        }
        render_row(header, true);
        render_separator();

        for (std::size_t i = 0; i < sized.rows_.size(); ++i) {
            render_row(sized.rows_[i], false);
            if (sized.separators_[i]) {
                render_separator();
            }
        }
    }

}  // namespace sdkir::cli
