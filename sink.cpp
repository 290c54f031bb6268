/**************************************************************************
 *
 * Copyright 2011-2014 Jose Fonseca
 * All Rights Reserved.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 *
 **************************************************************************/


#include <string.h>
#include <errno.h>
#include <unistd.h>

#include <stdexcept>
#include <system_error>

#include "heapsnap.h"


namespace heapsnap {


FdSink::FdSink(int fd) :
   _fd(fd),
   _written(0)
{
   if (fd < 0) {
      throw std::system_error(EBADF, std::generic_category(), "heapsnap: bad file descriptor");
   }
}


void
FdSink::write(const void *buf, size_t nbytes)
{
   const char *p = (const char *)buf;
   while (nbytes) {
      if (_written == sizeof _buf) {
         flush();
      }
      size_t n = sizeof _buf - _written;
      if (n > nbytes) {
         n = nbytes;
      }
      memcpy(_buf + _written, p, n);
      _written += n;
      p += n;
      nbytes -= n;
   }
}


void
FdSink::flush(void)
{
   size_t offset = 0;
   while (offset < _written) {
      ssize_t ret = ::write(_fd, _buf + offset, _written - offset);
      if (ret < 0) {
         if (errno == EINTR) {
            continue;
         }
         _written = 0;
         throw std::system_error(errno, std::generic_category(), "heapsnap: write");
      }
      offset += (size_t)ret;
   }
   _written = 0;
}


void
OstreamSink::write(const void *buf, size_t nbytes)
{
   _os.write((const char *)buf, (std::streamsize)nbytes);
   if (!_os) {
      throw std::runtime_error("heapsnap: stream write failed");
   }
}


void
OstreamSink::flush(void)
{
   _os.flush();
   if (!_os) {
      throw std::runtime_error("heapsnap: stream flush failed");
   }
}


} /* namespace heapsnap */


// vim:set sw=3 ts=3 et:
