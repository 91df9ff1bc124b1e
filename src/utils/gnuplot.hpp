#ifndef STRATA_UTILS_GNUPLOT_HPP
#define STRATA_UTILS_GNUPLOT_HPP

#include <algorithm>
#include <cstdio>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Strata::Utils {
    // Write-only pipe to a gnuplot process: inline 2D line series rendered to a file terminal.
    class Gnuplot {
    public:
        struct LineStyle {
            std::optional<double> lineWidth{};
            std::optional<std::string> lineColor{};
        };

        struct DataSet2D {
            std::vector<double> x{};
            std::vector<double> y{};
            std::string title{};
            LineStyle style{};
        };

        explicit Gnuplot(const std::string& command = "gnuplot") : pipe_(popen(command.c_str(), "w")) {
            if (pipe_ == nullptr) {
                throw std::runtime_error("Failed to start '" + command + "'");
            }
        }

        ~Gnuplot() {
            if (pipe_ != nullptr) {
                pclose(pipe_);
            }
        }

        Gnuplot(const Gnuplot&) = delete;
        Gnuplot& operator=(const Gnuplot&) = delete;

        void command(const std::string& line) {
            write(line);
            flush();
        }

        void setTerminal(const std::string& terminal) { command("set terminal " + terminal); }
        void setOutput(const std::string& file) { command("set output " + quoted(file)); }
        void unsetOutput() { command("unset output"); }
        void setTitle(const std::string& title) { command("set title " + quoted(title)); }
        void setXLabel(const std::string& label) { command("set xlabel " + quoted(label)); }
        void setYLabel(const std::string& label) { command("set ylabel " + quoted(label)); }
        void setGrid(bool enable = true) { command(enable ? "set grid" : "unset grid"); }

        // One "plot '-' ..., '-' ..." header, then every series inline, each closed by "e".
        void plot(const std::vector<DataSet2D>& series) {
            if (series.empty()) {
                throw std::invalid_argument("Gnuplot::plot needs at least one series");
            }
            std::ostringstream header;
            header << "plot ";
            for (std::size_t i = 0; i < series.size(); ++i) {
                header << (i == 0 ? "" : ", ") << "'-' " << describe(series[i]);
            }
            write(header.str());

            for (const auto& data : series) {
                const auto points = std::min(data.x.size(), data.y.size());
                for (std::size_t i = 0; i < points; ++i) {
                    if (std::fprintf(pipe_, "%.15g %.15g\n", data.x[i], data.y[i]) < 0) {
                        throw std::runtime_error("Failed to stream data to gnuplot");
                    }
                }
                write("e");
            }
            flush();
        }

    private:
        std::FILE* pipe_;

        void write(const std::string& line) {
            if (std::fputs((line + '\n').c_str(), pipe_) < 0) {
                throw std::runtime_error("Failed to write to gnuplot");
            }
        }

        void flush() {
            if (std::fflush(pipe_) != 0) {
                throw std::runtime_error("Failed to flush gnuplot pipe");
            }
        }

        static std::string quoted(const std::string& text) {
            std::string out{"'"};
            for (char ch : text) {
                out += ch == '\'' ? std::string("''") : std::string(1, ch);
            }
            return out + "'";
        }

        static std::string describe(const DataSet2D& data) {
            std::ostringstream stream;
            stream << (data.title.empty() ? std::string("notitle") : "title " + quoted(data.title)) << " with lines";
            if (data.style.lineWidth) {
                stream << " lw " << *data.style.lineWidth;
            }
            if (data.style.lineColor && !data.style.lineColor->empty()) {
                stream << " lc rgb " << quoted(*data.style.lineColor);
            }
            return stream.str();
        }
    };
}

#endif // STRATA_UTILS_GNUPLOT_HPP
