#include "di/cli/parser.h"
#include "di/container/string/string_view.h"
#include "di/io/writer_print.h"
#include "dius/main.h"
#include "dius/print.h"
#include "dius/sync_file.h"
#include "dius/system/process.h"
#include "presenter.h"
#include "prez/builder.h"
#include "prez/document.h"
#include "prez/drawer.h"
#include "prez/dump.h"
#include "prez/highlighting.h"
#include "prez/paths.h"
#include "prez/resources.h"
#include "prez/terminal_backend.h"
#include "prez/theme.h"

namespace prez {
struct Args {
    di::Vector<di::TransparentStringView> paths;
    di::Optional<di::TransparentStringView> theme;
    di::Optional<di::PathView> theme_path;
    di::Optional<usize> slide;
    di::Optional<di::PathView> log_path;
    bool dump { false };
    bool help { false };

    constexpr static auto get_cli_parser() {
        return di::cli_parser<Args>("prez"_sv, "Terminal slideshow presenter"_sv)
            .option<&Args::theme>('t', "theme"_tsv, "Name of the built-in theme to use (dark or light)"_sv)
            .option<&Args::theme_path>('T', "theme-path"_tsv, "Path to a JSON theme file"_sv)
            .option<&Args::slide>('s', "slide"_tsv, "Slide to start at (1 indexed)"_sv)
            .option<&Args::log_path>('l', "log-path"_tsv, "File to write logs to (defaults to /tmp/prez.log)"_sv)
            .option<&Args::dump>('d', "dump"_tsv, "Print the render operations of every slide and exit"_sv)
            .argument<&Args::paths>("PRESENTATION"_sv, "Presentation file to show"_sv)
            .help();
    }
};

// Theme names are plain ASCII, so this doesn't need to care about encodings.
static auto to_string(di::TransparentStringView text) -> di::String {
    auto result = di::String {};
    for (auto c : text) {
        result.push_back(c32(c));
    }
    return result;
}

static auto select_theme(Args const& args, ThemeProvider const& provider) -> di::Result<Theme> {
    if (args.theme && args.theme_path) {
        dius::eprintln("error: --theme and --theme-path cannot be used together"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    if (args.theme_path) {
        auto theme = provider.load_from_path(*args.theme_path);
        if (!theme) {
            dius::eprintln("error: {}"_sv, theme.error().message);
            return di::Unexpected(di::BasicError::InvalidArgument);
        }
        return di::move(theme).value();
    }
    if (args.theme) {
        auto name = to_string(*args.theme);
        auto theme = provider.lookup_by_name(name.view());
        if (!theme) {
            dius::eprintln("error: theme '{}' does not exist"_sv, name);
            return di::Unexpected(di::BasicError::InvalidArgument);
        }
        return di::move(theme).value();
    }
    return dark_theme();
}

static auto get_working_directory() -> di::Result<di::Path> {
    auto const& env = dius::system::get_environment();
    auto working_directory = env.at("PWD"_tsv).transform([&](di::TransparentStringView path) {
        return di::PathView(path).to_owned();
    });
    if (!working_directory) {
        return di::Unexpected(di::BasicError::NoSuchFileOrDirectory);
    }
    return di::move(working_directory).value();
}

static auto main(Args& args) -> di::Result<void> {
    if (args.paths.size() != 1) {
        dius::eprintln("error: prez requires exactly one presentation file"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    auto path = di::PathView(args.paths[0]);

    auto theme_provider = BuiltinThemeProvider {};
    auto theme = TRY(select_theme(args, theme_provider));

    auto document = load_document(path);
    if (!document) {
        dius::eprintln("error: failed to load presentation {}"_sv, path);
        return di::Unexpected(di::move(document).error());
    }

    auto element_count = document.value().elements.size();
    auto highlighter = PlainHighlighter {};
    // PNG images are handed to the terminal by path, so they must not depend on our working directory.
    auto document_path = path.to_owned();
    if (!path.is_absolute()) {
        auto working_directory = get_working_directory();
        if (!working_directory) {
            dius::eprintln("error: unable to determine the working directory to resolve {}"_sv, path);
            return di::Unexpected(di::move(working_directory).error());
        }
        document_path = absolute_path(path, working_directory.value());
    }
    auto resources = Resources(parent_directory(document_path));
    auto builder = PresentationBuilder(highlighter, theme, resources, theme_provider);
    auto presentation = builder.build(di::move(document).value().elements);

    if (args.dump) {
        if (!presentation) {
            dius::eprintln("error: {}"_sv, presentation.error().describe());
            return di::Unexpected(di::BasicError::InvalidArgument);
        }
        auto size = dius::stdin.get_tty_window_size()
                        .transform([](dius::tty::WindowSize const& size) {
                            return WindowSize::from_window_size(size);
                        })
                        .value_or(WindowSize { 24, 80, 0, 0 });
        dius::println("{}"_sv, dump_presentation(presentation.value(), size));
        return {};
    }

    // Setup - log to file, the terminal is about to be taken over.
    [[maybe_unused]] auto& log = dius::stderr =
        TRY(dius::open_sync(args.log_path.value_or("/tmp/prez.log"_pv), dius::OpenMode::WriteClobber));
    dius::eprintln("loaded presentation {} ({} elements)"_sv, path, element_count);

    auto backend = AnsiTerminalBackend(dius::stdin);
    auto drawer = Drawer::create(backend);
    if (!drawer) {
        dius::eprintln("failed to set up the terminal: {}"_sv, drawer.error().describe());
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    if (!presentation) {
        auto message = presentation.error().describe();
        dius::eprintln("failed to build presentation: {}"_sv, message);
        TRY(show_error(drawer.value(), dius::stdin, message.view()));
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    dius::eprintln("built {} slides"_sv, presentation.value().total_slides());

    if (args.slide) {
        if (*args.slide == 0 || *args.slide > presentation.value().total_slides()) {
            dius::eprintln("ignoring invalid starting slide {}"_sv, *args.slide);
        } else {
            presentation.value().jump_to(*args.slide - 1);
        }
    }

    auto presenter = Presenter(presentation.value(), drawer.value(), dius::stdin);
    return presenter.run();
}
}

DIUS_MAIN(prez::Args, prez)
