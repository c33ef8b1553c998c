#include "sv/app_info.hpp"
#include "sv/options.hpp"
#include "sv/stream/display_surface.hpp"
#include "sv/stream/stream_producer.hpp"
#include "sv/stream/stream_renderer.hpp"

#include "sample_text.hpp"
#include "stream_options.hpp"
#include "ui/stream_app.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

namespace
{
    const sv::appinfo::ToolInfo &tool_info()
    {
        return sv::appinfo::requireTool("sv-stream");
    }

    struct PlainGeometry
    {
        int width = 0;
        int height = 0;
    };

    struct CliOptions
    {
        bool showHelp = false;
        std::optional<std::string> filePath;
        std::optional<PlainGeometry> plain;
        std::string error;
    };

    bool is_help_flag(std::string_view arg)
    {
        return arg == "--help" || arg == "-h";
    }

    std::optional<int> parse_positive(std::string_view text)
    {
        int value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value <= 0)
            return std::nullopt;
        return value;
    }

    // WIDTHxHEIGHT, e.g. 80x24.
    std::optional<PlainGeometry> parse_geometry(std::string_view text)
    {
        auto separator = text.find('x');
        if (separator == std::string_view::npos)
            return std::nullopt;
        auto width = parse_positive(text.substr(0, separator));
        auto height = parse_positive(text.substr(separator + 1));
        if (!width || !height)
            return std::nullopt;
        return PlainGeometry{*width, *height};
    }

    CliOptions parse_cli(int argc, char **argv)
    {
        CliOptions options;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            if (is_help_flag(arg))
            {
                options.showHelp = true;
                continue;
            }

            std::optional<std::string_view> value;
            std::string_view name = arg;
            auto equals = arg.find('=');
            if (arg.rfind("--", 0) == 0 && equals != std::string_view::npos)
            {
                name = arg.substr(0, equals);
                value = arg.substr(equals + 1);
            }
            else if ((arg == "--file" || arg == "--plain") && i + 1 < argc)
            {
                value = std::string_view(argv[++i]);
            }

            if (name == "--file" && value)
            {
                options.filePath = std::string(*value);
            }
            else if (name == "--plain" && value)
            {
                options.plain = parse_geometry(*value);
                if (!options.plain)
                    options.error = "Invalid geometry '" + std::string(*value) + "', expected WIDTHxHEIGHT.";
            }
            else
            {
                options.error = "Unknown argument: " + std::string(arg);
            }
        }
        return options;
    }

    void print_usage()
    {
        const auto &info = tool_info();
        std::cout << "=== " << info.displayName << " ===\n";
        std::cout << info.shortDescription << "\n\n";
        std::cout << "Usage: " << info.executable << " [--file PATH] [--plain WIDTHxHEIGHT]\n";
        std::cout << "  --file PATH            stream the contents of PATH instead of the built-in sample\n";
        std::cout << "  --plain WIDTHxHEIGHT   render without the Turbo Vision interface and print the\n";
        std::cout << "                         rows visible at the end of the stream\n";
        std::cout << "Settings are read from " << sv::config::OptionRegistry("sv-stream").defaultOptionsPath().string()
                  << std::endl;
    }

    std::optional<std::string> read_file(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return std::nullopt;
        std::ostringstream contents;
        contents << in.rdbuf();
        if (in.bad())
            return std::nullopt;
        return contents.str();
    }

    int run_plain(const PlainGeometry &geometry, std::string text)
    {
        sv::config::OptionRegistry registry("sv-stream");
        sv::streamview::registerStreamOptions(registry);
        registry.loadDefaults();

        sv::stream::BufferSurface surface(geometry.width, geometry.height);
        sv::stream::StreamRenderer renderer(sv::streamview::rendererSettings(registry));
        renderer.attachSurface(&surface);
        renderer.setSize(geometry.width, geometry.height);

        sv::stream::StreamProducer producer(renderer);
        producer.start(std::move(text), sv::streamview::producerSettings(registry));

        // The tick loop stands in for the UI idle handler.
        const auto interval = renderer.settings().updateInterval;
        while (!producer.consumeFinished())
        {
            std::this_thread::sleep_for(interval);
            renderer.flushIfDirty();
        }
        renderer.forceUpdate();

        for (const auto &row : surface.visibleRows())
            std::cout << row << '\n';
        std::cout << std::flush;
        return 0;
    }

} // namespace

int main(int argc, char **argv)
{
    CliOptions options = parse_cli(argc, argv);
    if (!options.error.empty())
    {
        std::cerr << tool_info().executable << ": " << options.error << '\n';
        print_usage();
        return 2;
    }
    if (options.showHelp)
    {
        print_usage();
        return 0;
    }

    std::string text = sv::streamview::sampleStreamText();
    if (options.filePath)
    {
        auto contents = read_file(*options.filePath);
        if (!contents)
        {
            std::cerr << tool_info().executable << ": cannot read " << *options.filePath << '\n';
            return 1;
        }
        text = std::move(*contents);
    }

    if (options.plain)
        return run_plain(*options.plain, std::move(text));

    StreamApp app(std::move(text));
    app.run();
    app.shutDown();
    return 0;
}
