#include "shell.hpp"

#include <cctype>

namespace {

bool is_safe_character(const char c) {
	if (std::isalnum(static_cast<unsigned char>(c))) return true;
	switch (c) {
		case '@': case '%': case '+': case '=': case ':':
		case ',': case '.': case '/': case '_': case '-':
			return true;
		default:
			return false;
	}
}

bool is_variable_start(const char c) {
	return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_variable_character(const char c) {
	return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/** Returns the length of a `${NAME}` reference starting at `position`, or zero. */
std::size_t variable_length_at(const std::string &word, const std::size_t position) {
	if (word.compare(position, 2, "${") != 0) return 0;
	std::size_t end = position + 2;
	if (end >= word.size() || !is_variable_start(word[end])) return 0;
	while (end < word.size() && is_variable_character(word[end])) ++end;
	if (end >= word.size() || word[end] != '}') return 0;
	return end + 1 - position;
}

}

std::string shell_quote(const std::string &word) {
	if (word.empty()) return "''";

	bool safe = true;
	for (const char c : word) {
		if (!is_safe_character(c)) {
			safe = false;
			break;
		}
	}
	if (safe) return word;

	std::string result = "'";
	for (const char c : word) {
		if (c == '\'')
			result += "'\"'\"'";
		else
			result += c;
	}
	result += "'";
	return result;
}

std::string shell_join(const Command &command) {
	std::string result;
	for (const std::string &argument : command) {
		if (!result.empty()) result += ' ';
		result += shell_quote(argument);
	}
	return result;
}

std::string script_word(const std::string &word) {
	std::string result;
	std::string literal;
	bool has_variable = false;

	std::size_t position = 0;
	while (position < word.size()) {
		const std::size_t length = variable_length_at(word, position);
		if (length == 0) {
			literal += word[position++];
			continue;
		}

		if (!literal.empty()) {
			result += shell_quote(literal);
			literal.clear();
		}
		result += '"';
		result += word.substr(position, length);
		result += '"';
		position += length;
		has_variable = true;
	}

	if (!has_variable) return shell_quote(word);
	if (!literal.empty()) result += shell_quote(literal);
	return result;
}

std::string script_join(const Command &command) {
	std::string result;
	for (const std::string &argument : command) {
		if (!result.empty()) result += ' ';
		result += script_word(argument);
	}
	return result;
}

std::string script_variable(const std::string &name) {
	return "${" + name + "}";
}
