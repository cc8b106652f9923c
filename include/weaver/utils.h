/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef WEAVER_UTILS_H
#define WEAVER_UTILS_H

#include <weaver/constants.h>
#include <weaver/path.h>
#include <weaver/singleton.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <thread>
#include <type_traits>

#include <QString>
#include <QStringList>

#define WV_UTILS weaver::Utils::instance()

namespace weaver
{
namespace utils
{
enum class TimeoutAction
{
    retry,
    done
};

// string helpers
template <typename Str, typename Filter>
Str&& trim_begin(Str&& s, Filter&& filter);
template <typename Str>
Str&& trim_begin(Str&& s);
template <typename Str, typename Filter>
Str&& trim_end(Str&& s, Filter&& filter);
template <typename Str>
Str&& trim_end(Str&& s);
template <typename Str>
Str&& trim(Str&& s);

// Calls try_action until it reports done, sleeping poll_interval between attempts. Calls on_timeout once the
// deadline passes; try_action_for returns if on_timeout does.
template <typename OnTimeoutCallable, typename TryAction, typename... Args>
void try_action_for(OnTimeoutCallable&& on_timeout, std::chrono::milliseconds timeout, TryAction&& try_action,
                    Args&&... args);
} // namespace utils

class Utils : public Singleton<Utils>
{
public:
    Utils(const Singleton<Utils>::PrivatePass&) noexcept;

    virtual bool run_cmd_for_status(const QString& cmd, const QStringList& args, const int timeout = 30000) const;

    virtual std::string contents_of(const weaver::Path& file_path) const;
    virtual void sleep_for(const std::chrono::milliseconds& ms) const;
};
} // namespace weaver

namespace weaver::utils::detail
{
// see https://en.cppreference.com/w/cpp/string/byte/isspace#Notes
inline constexpr auto is_space = [](unsigned char c) { return std::isspace(c); };
} // namespace weaver::utils::detail

template <typename Str, typename Filter>
Str&& weaver::utils::trim_begin(Str&& s, Filter&& filter)
{
    const auto it = std::find_if_not(s.begin(), s.end(), std::forward<Filter>(filter));
    s.erase(s.begin(), it);
    return std::forward<Str>(s);
}

template <typename Str>
Str&& weaver::utils::trim_begin(Str&& s)
{
    return trim_begin(std::forward<Str>(s), detail::is_space);
}

template <typename Str, typename Filter>
Str&& weaver::utils::trim_end(Str&& s, Filter&& filter)
{
    auto rev_it = std::find_if_not(s.rbegin(), s.rend(), std::forward<Filter>(filter));
    s.erase(rev_it.base(), s.end());
    return std::forward<Str>(s);
}

template <typename Str>
Str&& weaver::utils::trim_end(Str&& s)
{
    return trim_end(std::forward<Str>(s), detail::is_space);
}

template <typename Str>
Str&& weaver::utils::trim(Str&& s)
{
    auto&& ret = trim_end(std::forward<Str>(s));
    return trim_begin(std::forward<decltype(ret)>(ret));
}

template <typename OnTimeoutCallable, typename TryAction, typename... Args>
void weaver::utils::try_action_for(OnTimeoutCallable&& on_timeout, std::chrono::milliseconds timeout,
                                   TryAction&& try_action, Args&&... args)
{
    static_assert(std::is_same<decltype(try_action(std::forward<Args>(args)...)), TimeoutAction>::value, "");

    const auto interval = std::min<std::chrono::milliseconds>(timeout, poll_interval);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (try_action(std::forward<Args>(args)...) == TimeoutAction::done)
            return;

        WV_UTILS.sleep_for(interval); // mocked in tests to avoid sleeping
    }

    on_timeout();
}

#endif // WEAVER_UTILS_H
