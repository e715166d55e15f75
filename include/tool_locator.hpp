/**
 * @file tool_locator.hpp
 * @brief Resolves restore tool executables before any restore work starts.
 */

#ifndef TOOL_LOCATOR_HPP
#define TOOL_LOCATOR_HPP

#include <optional>
#include <string>

/**
 * @brief Interface for executable discovery strategies.
 */
class ToolLocator {
public:
    virtual ~ToolLocator() = default;

    /**
     * @brief Resolves an executable name to a path.
     *
     * @param name Executable name, or a path containing '/'.
     * @return std::optional<std::string> Resolved path, or std::nullopt if not executable.
     */
    virtual std::optional<std::string> locate(const std::string& name) const = 0;

    bool exists(const std::string& name) const { return locate(name).has_value(); }
};

/**
 * @brief Searches the PATH environment variable the way the shell does.
 */
class PathToolLocator : public ToolLocator {
public:
    std::optional<std::string> locate(const std::string& name) const override;
};

#endif // TOOL_LOCATOR_HPP
