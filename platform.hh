#ifndef __PLATFORM_HH__
#define __PLATFORM_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// operating system services; implemented in unix/*.  everything here
// reports failure through E(), i.e. as an informative_failure.

#include "numeric_vocab.hh"

typedef int os_err_t;

void get_system_flavour(std::string & ident);

// filesystem stuff
std::string get_homedir();
std::string get_default_confdir();

namespace path
{
  typedef enum { nonexistent, directory, file } status;
};
path::status get_path_status(std::string const & path);
u64 get_file_size(std::string const & path);

struct dirent_consumer
{
  virtual ~dirent_consumer() {}
  virtual void consume(const char *) = 0;
};
void do_read_directory(std::string const & path,
                       dirent_consumer & files,
                       dirent_consumer & dirs,
                       dirent_consumer & other_files);

void rename_clobberingly(std::string const & from, std::string const & to);
void do_remove(std::string const & path);

void do_mkdir(std::string const & path);

// Write DAT to P by way of a temporary file in TMPDIR, which must be on
// the same filesystem, so that P is replaced atomically.
void write_data_worker(std::string const & p,
                       std::string const & dat,
                       std::string const & tmpdir,
                       bool user_private);

// strerror wrapper for OS-specific errors
std::string os_strerror(os_err_t errnum);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __PLATFORM_HH__
