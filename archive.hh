#ifndef __ARCHIVE_HH__
#define __ARCHIVE_HH__

// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <map>
#include "vector.hh"

#include "dates.hh"
#include "retention.hh"
#include "vocab.hh"

// a directory of dated report snapshots, one per calendar day.  each
// snapshot is stored either whole, as a base:
//
//   base_YYYYMMDD.xml
//
// or as a zero-context patch against the snapshot stored just before it:
//
//   delta_YYYYMMDD.patch
//
// the snapshot for a day D is the newest base dated on or before D, with
// every delta dated after that base and up to D applied in date order.
//
// an archive object assumes it is the only writer of its directory.
// any number of objects may read a directory nobody is writing.

// the directory is missing or cannot be read, or an artifact in it
// cannot be read
class archive_unavailable : public informative_failure
{
public:
  explicit archive_unavailable(std::string const & s)
    : informative_failure(s) {}
};

struct artifact
{
  enum kind_t { base_file, delta_file };

  date_t date;
  kind_t kind;
  // file name within the archive directory
  std::string name;
  u64 size;

  artifact() : kind(base_file), size(0) {}
  bool is_base() const { return kind == base_file; }
};

struct archive_options
{
  // whether writing a base deletes the bases dated before it
  bool prune_bases;
  retention_policy retention;

  archive_options() : prune_bases(true) {}
};

// file name for an artifact of the given kind and date
std::string artifact_name(artifact::kind_t kind, date_t const & when);

// the inverse; false for anything that isn't an artifact name
bool parse_artifact_name(std::string const & name,
                         artifact::kind_t & kind,
                         date_t & when);

class archive
{
public:
  // reads the directory listing; throws archive_unavailable
  archive(std::string const & dir,
          archive_options const & opts = archive_options());

  // makes TEXT the snapshot for WHEN, replacing any snapshot already
  // stored for that day.  snapshots for later days keep their contents.
  // if the snapshot before WHEN or any later one cannot be rebuilt, the
  // restore error propagates and no file has been touched.  deltas
  // after WHEN that have no base are deleted.
  void store(data const & text, date_t const & when);

  // the snapshot for WHEN, or false if no base is dated on or before it.
  // throws malformed_hunk_header or patch_conflict when the chain is
  // damaged, archive_unavailable when a file can't be read.
  bool restore(date_t const & when, data & out) const;

  bool find_prior_base(date_t const & on_or_before, artifact & out) const;

  // deltas dated in (AFTER, THROUGH], oldest first
  void deltas_between(date_t const & after,
                      date_t const & through,
                      std::vector<artifact> & out) const;

  bool latest(artifact & out) const;

  // every artifact, oldest first
  void list(std::vector<artifact> & out) const;

  // deletes the artifact for WHEN, if there is one
  void remove(date_t const & when);

  std::string const & directory() const { return dir; }
  std::string path_of(artifact const & a) const;

  // raw contents of an artifact file
  void read_artifact(artifact const & a, data & out) const;

private:
  std::string dir;
  archive_options opts;
  std::map<date_t, artifact> index;

  void load_index();
  void write_artifact(artifact::kind_t kind, date_t const & when,
                      data const & contents);
  void prune_bases_before(date_t const & when);
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __ARCHIVE_HH__
