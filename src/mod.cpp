// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <pagedread/mod.hpp>

namespace pagedread
{

namespace
{

/** @brief Splits on the first unescaped sep, returning {head, rest}.
 *         rest is empty and found is false when sep does not occur.
 */
std::pair<std::string_view, std::string_view>
    splitUnescaped(std::string_view str, char sep, bool& found)
{
    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '\\')
        {
            ++i;
        }
        else if (str[i] == sep)
        {
            found = true;
            return {str.substr(0, i), str.substr(i + 1)};
        }
    }
    found = false;
    return {str, {}};
}

std::string unescape(std::string_view in)
{
    std::string ret;
    ret.reserve(in.size());
    bool escaped = false;
    for (char c : in)
    {
        if (!escaped && c == '\\')
        {
            escaped = true;
            continue;
        }
        escaped = false;
        ret.push_back(c);
    }
    return ret;
}

} // namespace

ModArgs::ModArgs(std::string_view str)
{
    bool more = true;
    while (more)
    {
        auto [item, rest] = splitUnescaped(str, ',', more);
        bool is_kv;
        auto [key, value] = splitUnescaped(item, '=', is_kv);
        if (is_kv)
        {
            dict.insert_or_assign(unescape(key), unescape(value));
        }
        else
        {
            arr.push_back(unescape(item));
        }
        str = rest;
    }
}

} // namespace pagedread
