#pragma once

#include "etabar/common/config.hpp"
#include "etabar/render/bar_layout.hpp"
#include "etabar/render/colorizer.hpp"
#include "etabar/render/width_provider.hpp"
#include <CLI/CLI.hpp>
#include <memory>
#include <optional>
#include <string>

namespace etabar {
namespace cli {

// Bar styling flags shared by every command that draws a bar. Values given on
// the command line win over the [bar] section of the configuration.
struct StyleOptions {
    std::optional<std::string> fill_char;
    std::optional<std::string> track_char;
    std::optional<std::string> fill_color;
    std::optional<std::string> track_color;
    std::optional<std::string> color_mode;
    std::optional<int> width;
    
    void addTo(CLI::App* subcommand);
    
    render::BarStyle resolveStyle(const common::BarConfig& config) const;
    std::shared_ptr<const render::WidthProvider> resolveWidthProvider(const common::BarConfig& config) const;
    std::shared_ptr<const render::Colorizer> resolveColorizer(const common::BarConfig& config) const;
};

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual void setup(CLI::App* subcommand) = 0;
    virtual int execute() = 0;
    
    bool wasCalled() const;

protected:
    CLI::App* subcommand_ = nullptr;
    bool was_called_ = false;
    
    void markCalledOnParse(CLI::App* subcommand);
};

}}
