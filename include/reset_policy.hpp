/**
 * @file reset_policy.hpp
 * @brief Statements that return a restore target to an empty, grant-correct state.
 *
 * These statements are destructive and irreversible. Destinations only run them from
 * initialize(), and only when the reset was requested at construction time.
 */

#ifndef RESET_POLICY_HPP
#define RESET_POLICY_HPP

#include <string>

/**
 * @brief Quotes a PostgreSQL identifier ("name", with embedded quotes doubled).
 */
std::string quotePostgresIdentifier(const std::string& identifier);

/**
 * @brief Quotes a MySQL identifier (`name`, with embedded backticks doubled).
 */
std::string quoteMySQLIdentifier(const std::string& identifier);

/**
 * @brief Builds the PostgreSQL public schema reset.
 *
 * Drops the public schema with everything in it, recreates it empty and grants all
 * privileges on it to the restore user and to the public role.
 *
 * @param username Role that will own the restored objects.
 * @return std::string Statement sequence for psql -c.
 */
std::string resetStatement(const std::string& username);

/**
 * @brief Builds the MySQL database reset (drop and recreate the database).
 *
 * @param database Database to recreate.
 * @return std::string Statement sequence for mysql -e.
 */
std::string mysqlResetStatement(const std::string& database);

#endif // RESET_POLICY_HPP
