#ifndef __FILE_IO_H__
#define __FILE_IO_H__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vocab.hh"
#include "sanity.hh"
#include "platform.hh"
#include "vector.hh"

// this layer deals with talking to the filesystem, loading and saving
// files.  paths are plain strings in the filesystem's own encoding.

void require_path_is_directory(std::string const & path,
                               i18n_format const & message_if_nonexistent,
                               i18n_format const & message_if_file);

bool path_exists(std::string const & path);
bool directory_exists(std::string const & path);
bool file_exists(std::string const & path);

// "a/b/c" -> "a/b"; "c" -> "."; "/c" -> "/"
std::string dirname_of(std::string const & path);
// "a/b" + "c" -> "a/b/c"
std::string join_path(std::string const & dir, std::string const & leaf);

// create a directory and any missing parents
void mkdir_p(std::string const & path);

void delete_file(std::string const & path);
void delete_dir_recursive(std::string const & path);

void read_data(std::string const & path, data & data);
void read_directory(std::string const & path,
                    std::vector<std::string> & files,
                    std::vector<std::string> & dirs);

void read_data_stdin(data & dat);
// "-" means standard input
void read_data_for_command_line(std::string const & path, data & dat);

// atomic replacement: written to a temporary file in TMPDIR and renamed
// over PATH.  TMPDIR must be on the same filesystem as PATH.
void write_data(std::string const & path,
                data const & data,
                std::string const & tmpdir);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __FILE_IO_H__
