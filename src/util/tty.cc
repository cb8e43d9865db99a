#include "tty.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef SIDEDIFF_PLATFORM_POSIX
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

using namespace sidediff;

void
sidediff::tty_get_term_size(int* rows, int* cols) {
#ifdef SIDEDIFF_PLATFORM_POSIX
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        *rows = w.ws_row;
        *cols = w.ws_col;
        return;
    }

    // stdout is a pipe (e.g. `| less`); ask the controlling terminal instead.
    auto term_fd = open(ctermid(NULL), O_RDONLY);
    if (term_fd >= 0) {
        bool found = ioctl(term_fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0;
        close(term_fd);
        if (found) {
            *rows = w.ws_row;
            *cols = w.ws_col;
            return;
        }
    }
#endif

    const char* env_cols = getenv("COLUMNS");
    const char* env_rows = getenv("LINES");
    if (env_cols) {
        *cols = std::atoi(env_cols);
    }
    if (env_rows) {
        *rows = std::atoi(env_rows);
    }
}

bool
sidediff::tty_is_terminal() {
#ifdef SIDEDIFF_PLATFORM_POSIX
    return isatty(STDOUT_FILENO) != 0;
#else
    return false;
#endif
}

uint16_t
sidediff::tty_get_capabilities() {
    // If we're not outputting to a terminal, we don't output any colors.
    // NOTE: This will prevent colored output when piping to less or when
    //       redirecting to files.
    if (!tty_is_terminal()) {
        return TermColorSupport_None;
    }

    uint16_t capabilities = TermColorSupport_Ansi4bit;

    // The COLORTERM variable is usually available to indicate 24bit color support.
    const char* colorterm_var = getenv("COLORTERM");
    if (colorterm_var != nullptr) {
        const std::string colorterm(colorterm_var);
        if (colorterm == "24bit" || colorterm == "truecolor") {
            capabilities |= TermColorSupport_Ansi8bit | TermColorSupport_Ansi24bit;
        }
    }

    const char* term_var = getenv("TERM");
    if (term_var != nullptr) {
        const std::string term(term_var);
        if (term == "dumb") {
            return TermColorSupport_None;
        }
        if (term.find("256color") != std::string::npos) {
            capabilities |= TermColorSupport_Ansi8bit;
        }
    }

    return capabilities;
}
