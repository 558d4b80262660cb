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

#include <termios.h>
#include <unistd.h>

#include "utils/raw-terminal.hxx"

#include "logger.hxx"

utils::raw_terminal::raw_terminal(int fd) noexcept : fd_(fd)
{
    if (isatty(this->fd_) != 1)
    {
        return;
    }

    if (tcgetattr(this->fd_, &this->original_) != 0)
    {
        logger::warn<logger::domain::prompt>("tcgetattr failed on fd {}", this->fd_);
        return;
    }

    termios raw = this->original_;
    // ISIG off so Ctrl-C arrives as a byte instead of killing the transfer
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(this->fd_, TCSAFLUSH, &raw) == 0)
    {
        this->active_ = true;
    }
    else
    {
        logger::warn<logger::domain::prompt>("tcsetattr failed on fd {}", this->fd_);
    }
}

utils::raw_terminal::~raw_terminal() noexcept
{
    if (this->active_)
    {
        tcsetattr(this->fd_, TCSAFLUSH, &this->original_);
    }
}

bool
utils::raw_terminal::active() const noexcept
{
    return this->active_;
}
