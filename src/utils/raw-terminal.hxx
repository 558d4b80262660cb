/**
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <termios.h>

namespace utils
{
/**
 * Puts a terminal into non canonical, no echo, no signal mode for as long
 * as the object lives. Does nothing if fd is not a terminal.
 */
class raw_terminal final
{
  public:
    raw_terminal() = delete;
    explicit raw_terminal(int fd) noexcept;
    ~raw_terminal() noexcept;
    raw_terminal(const raw_terminal& other) = delete;
    raw_terminal(raw_terminal&& other) = delete;
    raw_terminal& operator=(const raw_terminal& other) = delete;
    raw_terminal& operator=(raw_terminal&& other) = delete;

    [[nodiscard]] bool active() const noexcept;

  private:
    int fd_;
    termios original_{};
    bool active_{false};
};
} // namespace utils
