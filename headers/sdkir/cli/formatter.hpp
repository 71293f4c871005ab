//
// Created by gregorian-rayne on 1/20/26.
//

#ifndef SDKIR_FORMATTER_HPP
#define SDKIR_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal colors and plain-text tables for CLI output.
 */

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace sdkir::cli {

    namespace colors {
        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /// True when colors are enabled and stdout is a terminal.
        bool enabled();

        void set_enabled(bool enable);
    }  // namespace colors

    bool is_tty();

    struct Column {
        std::string header;
        std::size_t width = 0;      // 0 = fit contents
        bool right_align = false;
        std::optional<std::string> color;
    };

    using Row = std::vector<std::string>;

    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);

        /// Draws a separator line below the last added row.
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        void clear();

        [[nodiscard]] bool empty() const { return rows_.empty(); }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
    };

    /// 1234567 -> "1,234,567"
    std::string format_count(std::size_t count);

}  // namespace sdkir::cli

#endif //SDKIR_FORMATTER_HPP
