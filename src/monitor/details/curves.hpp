#ifndef STRATA_MONITOR_DETAILS_CURVES_HPP
#define STRATA_MONITOR_DETAILS_CURVES_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "../../utils/gnuplot.hpp"
#include "sink.hpp"

namespace Strata::Monitor::Details {

    struct CurveOptions {
        std::string title{"Training losses"};
        std::string terminal{"pngcairo size 1024,640"};
        std::string command{"gnuplot"};
    };

    // Renders the selected scalar series to a PNG through gnuplot. Tags without samples are skipped;
    // nothing is spawned when none of them has any.
    inline bool render_curves(const History& history,
                              const std::vector<std::string>& tags,
                              const std::filesystem::path& output,
                              const CurveOptions& options = {})
    {
        std::vector<Utils::Gnuplot::DataSet2D> datasets;
        for (const auto& tag : tags) {
            const auto it = history.find(tag);
            if (it == history.end() || it->second.empty()) {
                continue;
            }
            Utils::Gnuplot::DataSet2D dataset;
            dataset.title = tag;
            dataset.style.lineWidth = 1.5;
            dataset.x.reserve(it->second.size());
            dataset.y.reserve(it->second.size());
            for (const auto& [step, value] : it->second) {
                dataset.x.push_back(static_cast<double>(step));
                dataset.y.push_back(value);
            }
            datasets.push_back(std::move(dataset));
        }
        if (datasets.empty()) {
            return false;
        }

        Utils::Gnuplot plotter(options.command);
        plotter.setTerminal(options.terminal);
        plotter.setOutput(output.string());
        plotter.setTitle(options.title);
        plotter.setXLabel("step");
        plotter.setYLabel("value");
        plotter.setGrid(true);
        plotter.plot(datasets);
        plotter.unsetOutput();
        return true;
    }
}

#endif // STRATA_MONITOR_DETAILS_CURVES_HPP
