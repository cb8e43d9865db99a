#include "config/config.hpp"
#include "output/side_by_side.hpp"
#include "processing/match_dump.hpp"
#include "util/file_status.hpp"
#include "util/readlines.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

std::string
capabilities_repr(uint16_t capabilities) {
    std::string result;
    if (capabilities & sidediff::TermColorSupport_Ansi4bit) {
        result += "16 ";
    }
    if (capabilities & sidediff::TermColorSupport_Ansi8bit) {
        result += "256 ";
    }
    if (capabilities & sidediff::TermColorSupport_Ansi24bit) {
        result += "truecolor ";
    }
    if (result.empty()) {
        return "none";
    }
    result.pop_back();
    return result;
}

}  // namespace

int
main(int argc, char* argv[]) {
    const bool invoked_as_git_tool = getenv("GIT_PREFIX") != nullptr;

    sidediff::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] OLD NEW

Show two versions of a file side by side, highlighting the changed parts.

Options:
    -h, --help                   show this help and exit
    -v, --version                show program version and exit
    -m, --matches FILE           match dump produced by the structural matcher
    -w, --width N                display width (default: terminal width, else 80)
    -c, --color WHEN             always, never or auto
    -b, --background TONE        dark or light
    -d, --display MODE           side-by-side or side-by-side-show-both
    -l, --language NAME          language name shown in the header
        --no-syntax-highlight    only highlight changes
    -o, --old-name NAME          display name for OLD
    -n, --new-name NAME          display name for NEW
        --debug                  print the loaded hunks to stderr

Environment:
    SIDEDIFF_BACKGROUND, SIDEDIFF_COLOR, SIDEDIFF_DISPLAY, SIDEDIFF_WIDTH,
    SIDEDIFF_SYNTAX_HIGHLIGHT set the defaults for the options above.
)",
                                       argv[0]);

        if (!optional_error_message.empty()) {
            help += "\n" + optional_error_message + "\n";
            fmt::print(stderr, "{}", help);
        } else {
            fmt::print("{}", help);
        }
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"matches", required_argument, 0, 'm'},
                                               {"width", required_argument, 0, 'w'},
                                               {"color", required_argument, 0, 'c'},
                                               {"background", required_argument, 0, 'b'},
                                               {"display", required_argument, 0, 'd'},
                                               {"language", required_argument, 0, 'l'},
                                               {"old-name", required_argument, 0, 'o'},
                                               {"new-name", required_argument, 0, 'n'},
                                               {"no-syntax-highlight", no_argument, 0, '1'},
                                               {"debug", no_argument, 0, '2'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvm:w:c:b:d:l:o:n:", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", SIDEDIFF_VERSION);
                    exit(0);
                case 'h':
                    opts.help = true;
                    return true;
                case 'm':
                    opts.matches_file = optarg;
                    break;
                case 'w':
                    if (!sidediff::parse_display_width(optarg, opts.width)) {
                        show_help(fmt::format("error: invalid value for --width ({}), expected 1 to {}", optarg,
                                              sidediff::kMaxDisplayWidth));
                        return false;
                    }
                    break;
                case 'c':
                    opts.color = sidediff::color_mode_from_string(optarg);
                    if (opts.color == sidediff::ColorMode::kInvalid) {
                        show_help(fmt::format("error: invalid value for --color ({})", optarg));
                        return false;
                    }
                    break;
                case 'b':
                    opts.background = sidediff::background_from_string(optarg);
                    if (opts.background == sidediff::BackgroundColor::kInvalid) {
                        show_help(fmt::format("error: invalid value for --background ({})", optarg));
                        return false;
                    }
                    break;
                case 'd':
                    opts.display_mode = sidediff::display_mode_from_string(optarg);
                    if (opts.display_mode == sidediff::DisplayMode::kInvalid) {
                        show_help(fmt::format("error: invalid value for --display ({})", optarg));
                        return false;
                    }
                    break;
                case 'l':
                    opts.language = optarg;
                    break;
                case 'o':
                    opts.left_file_name = optarg;
                    break;
                case 'n':
                    opts.right_file_name = optarg;
                    break;
                case '1':
                    opts.syntax_highlight = false;
                    break;
                case '2':
                    opts.debug = true;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return false;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("error: expected two files, OLD and NEW");
            return false;
        }

        opts.left_file = in_argv[optind];
        opts.right_file = in_argv[optind + 1];

        auto a_status = sidediff::check_file_status(opts.left_file);
        auto b_status = sidediff::check_file_status(opts.right_file);
        if (!sidediff::is_usable(a_status) || !sidediff::is_usable(b_status)) {
            std::string err;
            if (!sidediff::is_usable(a_status))
                err += fmt::format("error: file '{}': {}\n", opts.left_file, sidediff::to_string(a_status));
            if (!sidediff::is_usable(b_status))
                err += fmt::format("error: file '{}': {}\n", opts.right_file, sidediff::to_string(b_status));
            err.pop_back();
            show_help(err);
            return false;
        }

        // As a ´git difftool´ the files are temporaries, BASE is the path in the repository.
        const char* git_base = getenv("BASE");
        if (invoked_as_git_tool && git_base != nullptr) {
            if (opts.left_file_name.empty()) {
                opts.left_file_name = git_base;
            }
            if (opts.right_file_name.empty()) {
                opts.right_file_name = git_base;
            }
        }

        if (opts.left_file_name.empty()) {
            opts.left_file_name = opts.left_file;
        }
        if (opts.right_file_name.empty()) {
            opts.right_file_name = opts.right_file;
        }

        return true;
    };

    // Load the defaults from the environment before we override them with command line args
    sidediff::config_apply_environment(opts);

    if (!parse_args(argc, argv)) {
        return 1;
    }

    if (opts.help) {
        show_help("");
        return 0;
    }

    sidediff::DiffInput diff_input;
    diff_input.lhs_display_path = opts.left_file_name;
    diff_input.rhs_display_path = opts.right_file_name;

    if (!sidediff::load_source(opts.left_file, diff_input.lhs_src) ||
        !sidediff::load_source(opts.right_file, diff_input.rhs_src)) {
        return 1;
    }

    if (!opts.language.empty()) {
        diff_input.language_name = opts.language;
    } else {
        const bool added_or_changed = sidediff::check_file_status(opts.right_file) != sidediff::FileStatus::kNullPath;
        diff_input.language_name =
            sidediff::language_name_from_path(added_or_changed ? opts.right_file_name : opts.left_file_name);
    }

    sidediff::MatchDump dump;
    const bool one_side_empty = diff_input.lhs_src.empty() || diff_input.rhs_src.empty();
    if (opts.matches_file.empty()) {
        if (!one_side_empty) {
            show_help("error: both files have content, a match dump (--matches) is required");
            return 1;
        }
    } else {
        std::string dump_text;
        if (!sidediff::read_file(opts.matches_file, dump_text)) {
            return 1;
        }

        sidediff::MatchDumpParseResult result;
        if (!sidediff::parse_match_dump(dump_text, dump, result)) {
            fmt::print(stderr, "error: {}:{}: {}\n", opts.matches_file, result.line, result.error);
            return 1;
        }

        const auto lhs_line_count = static_cast<int64_t>(sidediff::split_on_newlines(diff_input.lhs_src).size());
        const auto rhs_line_count = static_cast<int64_t>(sidediff::split_on_newlines(diff_input.rhs_src).size());
        if (!sidediff::validate_match_dump(dump, lhs_line_count, rhs_line_count, result)) {
            fmt::print(stderr, "error: {}: {}\n", opts.matches_file, result.error);
            return 1;
        }
    }

    diff_input.lhs_positions = dump.lhs_positions;
    diff_input.rhs_positions = dump.rhs_positions;

    int rows = 0;
    int cols = 0;
    int64_t width = opts.width;
    if (width == 0) {
        sidediff::tty_get_term_size(&rows, &cols);
        width = cols > 0 ? cols : 80;
    }

    sidediff::DisplayOptions display_options;
    display_options.background_color = opts.background;
    display_options.display_mode = opts.display_mode;
    display_options.display_width = std::clamp(width, sidediff::kMinDisplayWidth, sidediff::kMaxDisplayWidth);
    display_options.in_vcs = invoked_as_git_tool;
    display_options.syntax_highlight = opts.syntax_highlight;
    switch (opts.color) {
        case sidediff::ColorMode::kAlways:
            display_options.use_color = true;
            break;
        case sidediff::ColorMode::kNever:
            display_options.use_color = false;
            break;
        default:
            display_options.use_color = sidediff::tty_is_terminal();
            break;
    }

    if (opts.debug) {
        fmt::print(stderr, "display width: {}, color: {} (terminal supports: {}), in vcs: {}\n",
                   display_options.display_width, display_options.use_color,
                   capabilities_repr(sidediff::tty_get_capabilities()), display_options.in_vcs);
        fmt::print(stderr, "{}", sidediff::dump_match_dump(dump));
    }

    sidediff::side_by_side_diff(diff_input, dump.hunks, display_options);

    return 0;
}
