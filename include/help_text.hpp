#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/** @brief Print usage, subcommands and options to stdout. */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
