/******************************************************************************\
 * appboot_argv.hpp - Managed argument arrays and getopt based option parsing
 *
 * Copyright 2026 Hewlett Packard Enterprise Development LP.
 *
 *     Redistribution and use in source and binary forms, with or
 *     without modification, are permitted provided that the following
 *     conditions are met:
 *
 *      - Redistributions of source code must retain the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer.
 *
 *      - Redistributions in binary form must reproduce the above
 *        copyright notice, this list of conditions and the following
 *        disclaimer in the documentation and/or other materials
 *        provided with the distribution.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
 * BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
 * ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
 * CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 ******************************************************************************/
#pragma once

#include <ctype.h>
#include <getopt.h>

#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace appboot {

/*
** NULL-terminated argument array for execvp built from owned strings. The
** pointer array is rebuilt on every get(), so it stays valid across moves.
*/
class ManagedArgv {
private:
    std::vector<std::string>    m_args;
    mutable std::vector<char*>  m_ptrs;

public:
    ManagedArgv() = default;

    ManagedArgv(std::initializer_list<std::string> args)
        : m_args{args}
    {}

    explicit ManagedArgv(std::vector<std::string> args)
        : m_args{std::move(args)}
    {}

    ManagedArgv(ManagedArgv const&) = delete;
    ManagedArgv& operator=(ManagedArgv const&) = delete;

    ManagedArgv(ManagedArgv&& moved)
        : m_args{std::move(moved.m_args)}
    {
        moved.m_args.clear();
    }

    ManagedArgv& operator=(ManagedArgv&& moved)
    {
        m_args = std::move(moved.m_args);
        moved.m_args.clear();
        return *this;
    }

    // number of entries including the terminator
    size_t size() const { return m_args.size() + 1; }

    char* const* get() const
    {
        m_ptrs.clear();
        m_ptrs.reserve(m_args.size() + 1);
        for (auto&& arg : m_args) {
            m_ptrs.push_back(const_cast<char*>(arg.c_str()));
        }
        m_ptrs.push_back(nullptr);
        return m_ptrs.data();
    }

    void add(std::string const& arg) { m_args.push_back(arg); }

    void add(char const* arg)
    {
        if (arg == nullptr) {
            throw std::logic_error("attempted to add nullptr pointer to managed argument array");
        }
        m_args.emplace_back(arg);
    }

    void add(std::vector<std::string> const& args)
    {
        m_args.insert(m_args.end(), args.begin(), args.end());
    }

    // command line for the debug log, quoting only what a shell would split
    std::string string() const
    {
        auto result = std::string{};
        for (auto&& arg : m_args) {
            if (!result.empty()) {
                result.push_back(' ');
            }
            if (arg.empty() || (arg.find_first_of(" \t\"'$\\") != std::string::npos)) {
                result += "'" + arg + "'";
            } else {
                result += arg;
            }
        }
        return result;
    }
};

// option table entries for IncomingArgv
struct Argv {
    using GNUOption = struct option;
    static constexpr GNUOption long_options_done { nullptr, 0, nullptr, 0 };

    struct Option : public GNUOption {
        explicit constexpr Option(const char* longFlag, int shortFlag) :
            GNUOption { longFlag, no_argument, nullptr, shortFlag } {}
    };

    struct Parameter : public GNUOption {
        explicit constexpr Parameter(const char* longFlag, int shortFlag) :
            GNUOption { longFlag, required_argument, nullptr, shortFlag } {}
    };
};

/*
** getopt_long over an ArgvDef option table. Parsing stops at the first
** non-option or at "--"; what follows is left for the target program.
** Option values without a short flag use small integers as their val.
*/
template <class ArgvDef>
class IncomingArgv : public ArgvDef {
private:
    int          m_argc;
    char* const* m_argv;
    std::string  m_shortFlags;
    int          m_optind;

    static std::string shortFlags()
    {
        auto result = std::string{"+"};
        for (auto opt = ArgvDef::long_options; opt->name != nullptr; opt++) {
            if (::isalpha(opt->val)) {
                result.push_back(static_cast<char>(opt->val));
                if (opt->has_arg == required_argument) {
                    result.push_back(':');
                }
            }
        }
        return result;
    }

public:
    IncomingArgv(int argc, char* const* argv)
        : m_argc{argc}
        , m_argv{argv}
        , m_shortFlags{shortFlags()}
        , m_optind{0}
    {}

    // (option value, argument); value is -1 when parsing is done
    std::pair<int, std::string> get_next()
    {
        // getopt keeps global state, restore it for any other parser
        auto const savedOptind = optind;
        optind = m_optind;
        auto const c = getopt_long(m_argc, m_argv, m_shortFlags.c_str(), ArgvDef::long_options, nullptr);
        m_optind = optind;
        optind = savedOptind;

        return std::make_pair(c, ((c >= 0) && (optarg != nullptr)) ? std::string{optarg} : std::string{});
    }

    // arguments after the options, for the target program
    std::vector<std::string> get_rest() const
    {
        auto const first = (m_optind > 0) ? m_optind : 1;
        return std::vector<std::string>(m_argv + std::min(first, m_argc), m_argv + m_argc);
    }
};

} /* namespace appboot */
