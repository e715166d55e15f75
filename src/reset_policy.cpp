#include "reset_policy.hpp"
#include <format>

namespace {

std::string quoteWith(const std::string& identifier, char quote) {
    std::string quoted(1, quote);
    for (char c : identifier) {
        if (c == quote) {
            quoted += quote;
        }
        quoted += c;
    }
    quoted += quote;
    return quoted;
}

} // namespace

std::string quotePostgresIdentifier(const std::string& identifier) {
    return quoteWith(identifier, '"');
}

std::string quoteMySQLIdentifier(const std::string& identifier) {
    return quoteWith(identifier, '`');
}

std::string resetStatement(const std::string& username) {
    return std::format(
        "DROP SCHEMA public CASCADE; "
        "CREATE SCHEMA public; "
        "GRANT ALL ON SCHEMA public TO {}; "
        "GRANT ALL ON SCHEMA public TO public;",
        quotePostgresIdentifier(username));
}

std::string mysqlResetStatement(const std::string& database) {
    auto name = quoteMySQLIdentifier(database);
    return std::format("DROP DATABASE IF EXISTS {}; CREATE DATABASE {};", name, name);
}
