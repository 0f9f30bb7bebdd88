#ifndef NBKP_HELP_HPP
#define NBKP_HELP_HPP

void print_help();

void print_version();

#endif // NBKP_HELP_HPP
