#ifndef NBKP_SHELL_HPP
#define NBKP_SHELL_HPP

#include <string>
#include <vector>

/** An external command as an explicit argument vector (never a shell string). */
using Command = std::vector<std::string>;

/** Quotes a word for a POSIX shell. Words made of safe characters only
 * are returned unchanged, everything else is wrapped in single quotes. */
std::string shell_quote(const std::string &word);

/** Quotes every argument and joins them with spaces. */
std::string shell_join(const Command &command);

/** Like `shell_quote`, but keeps `${NAME}` references expandable.
 * Used by the script renderer, where snapshot names and timestamps are
 * only known when the generated script runs. */
std::string script_word(const std::string &word);

std::string script_join(const Command &command);

/** Builds a `${NAME}` reference understood by `script_word`. */
std::string script_variable(const std::string &name);

#endif // NBKP_SHELL_HPP
