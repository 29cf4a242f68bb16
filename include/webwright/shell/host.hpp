/*
 * Host environment backend - Webwright
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <map>
#include <string>

namespace webwright {

// Process-level side of SessionState mutations. The POSIX backend writes the
// real environment and working directory; tests use the in-memory one.
class HostEnvironment {
public:
    virtual ~HostEnvironment() = default;
    virtual std::map<std::string, std::string> initial_environment() const = 0;
    virtual std::string initial_directory() const = 0;
    // Returns false (errno preserved) when the OS call fails.
    virtual bool set_env(const std::string& name, const std::string& value) = 0;
    virtual bool unset_env(const std::string& name) = 0;
    virtual bool change_directory(const std::string& path) = 0;
};

class PosixHostEnvironment : public HostEnvironment {
public:
    std::map<std::string, std::string> initial_environment() const override;
    std::string initial_directory() const override;
    bool set_env(const std::string& name, const std::string& value) override;
    bool unset_env(const std::string& name) override;
    bool change_directory(const std::string& path) override;
};

class InMemoryHostEnvironment : public HostEnvironment {
public:
    InMemoryHostEnvironment(std::map<std::string, std::string> env, std::string cwd)
        : m_env(std::move(env)), m_cwd(std::move(cwd)) {}
    std::map<std::string, std::string> initial_environment() const override { return m_env; }
    std::string initial_directory() const override { return m_cwd; }
    bool set_env(const std::string& name, const std::string& value) override { m_env[name] = value; return true; }
    bool unset_env(const std::string& name) override { m_env.erase(name); return true; }
    bool change_directory(const std::string& path) override { m_cwd = path; return true; }

    const std::map<std::string, std::string>& env() const { return m_env; }
    const std::string& cwd() const { return m_cwd; }
private:
    std::map<std::string, std::string> m_env;
    std::string m_cwd;
};

} // namespace webwright
