#pragma once
#include <string>
#include <vector>

/**
 * Splits a PostgreSQL script on top-level semicolons.
 *
 * Semicolons inside 'strings', E'escaped\' strings', "identifiers", $tag$ dollar
 * quotes $tag$, -- line comments and nested block comments do not split.
 * Statements keep their terminating ';' and are trimmed; chunks holding only
 * whitespace or comments are dropped. Order is preserved.
 */
std::vector<std::string> split_statements(const std::string& sql);
