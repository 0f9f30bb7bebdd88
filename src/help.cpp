#include "help.hpp"

#include <iostream>

#include "constants.hpp"

const char *HELP =
	"Usage: nbkp <command> [OPTIONS]\n"
	"\n"
	"The nbkp utility backs up directories between local and remote volumes with rsync,\n"
	"optionally keeping btrfs or hard-link snapshots of every run.\n"
	"Volumes, ssh endpoints and syncs are declared in a JSON configuration file.\n"
	"\n"
	"COMMANDS:\n"
	"check:	Report which volumes are available and which syncs are ready to run.\n"
	"run:	Run every enabled sync in dependency order, snapshotting and pruning its destination.\n"
	"prune:	Only remove the snapshots beyond each sync's max-snapshots.\n"
	"sh:	Print a standalone bash script that performs the same syncs without nbkp.\n"
	"\n"
	"OPTIONS:\n"
	"-h, --help:	Display help information and exit.\n"
	"--version:	Display the program version and exit.\n"
	"-c, --config FILE:	Use this configuration file instead of $XDG_CONFIG_HOME/nbkp/config.json or /etc/nbkp/config.json.\n"
	"-s, --sync PATTERN:	Only consider syncs whose name matches the pattern ('*' and '?' wildcards). May be repeated.\n"
	"-n, --dry-run:	Check and plan everything, printing the commands instead of running them (run, prune).\n"
	"--no-prune:	Do not remove old snapshots after a run.\n"
	"-l, --location NAME:	Prefer ssh endpoints declared with this location.\n"
	"--private, --public:	Prefer ssh endpoints whose host resolves to a private (or public) address.\n"
	"--progress MODE:	rsync progress reporting: none, overall, per-file or full.\n"
	"--output FORMAT:	Report format: human (default) or json.\n"
	"-o, --output-file FILE:	Write the generated script to FILE instead of standard output (sh).\n"
	"-v, --verbose:	Print every command as it is run.\n"
	"--test:	Runs implementation tests. Used by developers and testers.\n"
	"\n"
	"EXIT CODES:\n"
	"0 success, 1 incorrect usage, 2 a sync failed, 3 filesystem error,\n"
	"4 configuration error, 5 incompatible configuration version.\n";

void print_help() {
	std::cout << HELP << std::endl;
}

void print_version() {
	std::cout << "nbkp " << PROGRAM_VERSION << std::endl;
}
