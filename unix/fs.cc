// copyright (C) 2005 nathaniel smith <njs@pobox.com>
// all rights reserved.
// licensed to the public under the terms of the GNU GPL (>= 2)
// see the file COPYING for details


#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif

#include "base.hh"
#include <unistd.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <pwd.h>
#include <stdio.h>
#include <fcntl.h>
#include <dirent.h>

#include "sanity.hh"
#include "constants.hh"
#include "platform.hh"

using std::string;

string
get_homedir()
{
  char * home = getenv("HOME");
  if (home != NULL)
    return string(home);

  struct passwd * pw = getpwuid(getuid());
  N(pw != NULL, F("could not find home directory for uid %d") % getuid());
  return string(pw->pw_dir);
}

string
get_default_confdir()
{
  return get_homedir() + "/" + constants::default_confdir_name;
}

path::status
get_path_status(string const & path)
{
  struct stat buf;
  int res;
  res = stat(path.c_str(), &buf);
  if (res < 0)
    {
      const int err = errno;
      if (err == ENOENT || err == ENOTDIR)
        return path::nonexistent;
      else
        E(false, F("error accessing file %s: %s") % path % os_strerror(err));
    }
  if (S_ISREG(buf.st_mode))
    return path::file;
  else if (S_ISDIR(buf.st_mode))
    return path::directory;
  else
    {
      // fifo or device or who knows what...
      E(false, F("cannot handle special file %s") % path);
    }
}

u64
get_file_size(string const & path)
{
  struct stat buf;
  if (stat(path.c_str(), &buf) < 0)
    {
      const int err = errno;
      E(false, F("error accessing file %s: %s") % path % os_strerror(err));
    }
  E(S_ISREG(buf.st_mode), F("%s is not a regular file") % path);
  return static_cast<u64>(buf.st_size);
}

namespace
{
  // RAII object for DIRs.
  struct dirhandle
  {
    dirhandle(string const & path)
    {
      d = opendir(path.c_str());
      if (!d)
        {
          const int err = errno;
          E(false, F("could not open directory '%s': %s") % path % os_strerror(err));
        }
    }
    // technically closedir can fail, but there's nothing we could do about it.
    ~dirhandle() { closedir(d); }

    struct dirent * next() { return readdir(d); }
    private:
    DIR *d;
  };
}

void
do_read_directory(string const & path,
                  dirent_consumer & files,
                  dirent_consumer & dirs,
                  dirent_consumer & specials)
{
  string p(path);
  if (p == "")
    p = ".";

  dirhandle dir(p);
  struct dirent *d;
  struct stat st;

  while ((d = dir.next()) != 0)
    {
      if (!strcmp(d->d_name, ".") || !strcmp(d->d_name, ".."))
        continue;
#if defined(_DIRENT_HAVE_D_TYPE) || defined(HAVE_STRUCT_DIRENT_D_TYPE)
      switch (d->d_type)
        {
        case DT_REG:
          files.consume(d->d_name);
          continue;
        case DT_DIR:
          dirs.consume(d->d_name);
          continue;
        default:
          // unknown, or a symlink: find out what is at the other end
          break;
        }
#endif

      string full = p + "/" + d->d_name;
      int st_result = stat(full.c_str(), &st);
      // a broken symlink; look at the link itself
      if (st_result < 0 && errno == ENOENT)
        st_result = lstat(full.c_str(), &st);

      int err = errno;

      E(st_result == 0,
        F("error accessing '%s': %s") % full % os_strerror(err));

      if (S_ISREG(st.st_mode))
        files.consume(d->d_name);
      else if (S_ISDIR(st.st_mode))
        dirs.consume(d->d_name);
      else
        specials.consume(d->d_name);
    }
}

void
rename_clobberingly(string const & from, string const & to)
{
  if (rename(from.c_str(), to.c_str()))
    {
      const int err = errno;
      E(false, F("renaming '%s' to '%s' failed: %s") % from % to % os_strerror(err));
    }
}

void
do_remove(string const & path)
{
  if (remove(path.c_str()))
    {
      const int err = errno;
      E(false, F("could not remove '%s': %s") % path % os_strerror(err));
    }
}

// Create the directory DIR.  It will be world-accessible modulo umask.
// Caller is expected to check for the directory already existing.
void
do_mkdir(string const & path)
{
  if (mkdir(path.c_str(), 0777))
    {
      const int err = errno;
      E(false, F("could not create directory '%s': %s") % path % os_strerror(err));
    }
}

// Create a temporary file in directory DIR, writing its name to NAME and
// returning a read-write file descriptor for it.  mkstemp() does not let
// us choose the mode, so this follows libiberty's mkstemps().  Names use
// lowercase letters only, for the sake of case-insensitive filesystems;
// they never collide with artifact names.

static int
make_temp_file(string const & dir, string & name, mode_t mode)
{
  static const char letters[]
    = "abcdefghijklmnopqrstuvwxyz0123456789";

  const u32 base = sizeof letters - 1;
  const u32 limit = base*base*base * base*base*base;

  static u32 value;
  struct timeval tv;
  string tmp = dir + "/faxxxxxx.tmp";

  gettimeofday(&tv, 0);
  value += ((u32) tv.tv_usec << 16) ^ tv.tv_sec ^ getpid();
  value %= limit;

  for (u32 i = 0; i < limit; i++)
    {
      u32 v = value;

      for (size_t pos = tmp.size() - 10; pos < tmp.size() - 4; ++pos)
        {
          tmp.at(pos) = letters[v % base];
          v /= base;
        }

      int fd = open(tmp.c_str(), O_RDWR|O_CREAT|O_EXCL, mode);
      int err = errno;

      if (fd >= 0)
        {
          name = tmp;
          return fd;
        }

      // EEXIST means go 'round again; anything else is a plain error.
      E(err == EEXIST,
        F("cannot create temp file %s: %s") % tmp % os_strerror(err));

      // This increment is relatively prime to 'limit', therefore 'value'
      // will visit every number in its range.
      value += 7777;
      value %= limit;
    }

  // we really should never get here.
  E(false, F("all %d possible temporary file names are in use") % limit);
}

void
write_data_worker(string const & fname,
                  string const & dat,
                  string const & tmpdir,
                  bool user_private)
{
  struct auto_closer
  {
    int fd;
    auto_closer(int fd) : fd(fd) {}
    ~auto_closer() { close(fd); }
  };

  string tmp;
  int fd = make_temp_file(tmpdir, tmp, user_private ? 0600 : 0666);

  try
    {
      auto_closer guard(fd);

      char const * ptr = dat.data();
      size_t remaining = dat.size();
      int deadcycles = 0;

      L(FL("writing %s via temp %s") % fname % tmp);

      while (remaining > 0)
        {
          ssize_t written = write(fd, ptr, remaining);
          const int err = errno;
          E(written >= 0,
            F("error writing to temp file %s: %s") % tmp % os_strerror(err));
          if (written == 0)
            {
              deadcycles++;
              E(deadcycles < 4,
                FP("giving up after four zero-length writes to %s "
                   "(%d byte written, %d left)",
                   "giving up after four zero-length writes to %s "
                   "(%d bytes written, %d left)",
                   ptr - dat.data())
                % tmp % (ptr - dat.data()) % remaining);
            }
          ptr += written;
          remaining -= written;
        }

      E(fsync(fd) == 0,
        F("error flushing temp file %s: %s") % tmp % os_strerror(errno));
    }
  catch (informative_failure &)
    {
      unlink(tmp.c_str());
      throw;
    }
  // fd is now closed

  rename_clobberingly(tmp, fname);
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
