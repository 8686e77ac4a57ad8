// ==============================================================================
// mustgather/output.hpp - Пользовательский вывод и диагностика
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностические сообщения с префиксами ([+] [!] [x] [*] [~])
// - Цветной вывод (ANSI escape codes, только для TTY)
// - Таблицы (Unicode box-drawing)
// - JSON вывод (RapidJSON)
//
// stdout - только результаты; stderr - только диагностика.
//
// ==============================================================================

#ifndef MUSTGATHER_OUTPUT_HPP
#define MUSTGATHER_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace mustgather::output {

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить info и warn
    int verbose = 0;     // -v: 1 = debug, 2+ = trace
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (verbose >= 1)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (verbose >= 2)
    void trace(std::string_view message);

    /// Строка результата в stdout, зелёным на TTY
    void green_line(std::string_view message);

    /// Pretty JSON в stdout + "\n"
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);
    void write_colored(Stream s, std::string_view message, Color color);
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w) const;

    std::string to_string() const;

private:
    std::string format_line(char position, const std::vector<size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;
    std::vector<size_t> calculate_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color);

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

/// Число отображаемых символов UTF-8 строки (для выравнивания таблиц)
size_t display_width(std::string_view s);

}  // namespace mustgather::output

#endif  // MUSTGATHER_OUTPUT_HPP
