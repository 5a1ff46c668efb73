#ifndef __RANDOMFILE_HH__
#define __RANDOMFILE_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vector.hh"
#include <boost/lexical_cast.hpp>

#include "randomizer.hh"

// builds pairs of report-like texts (one line per element, newline
// kept) where the second is a random edit of the first, for exercising
// the differ and the patcher against each other.

struct file_randomizer
{
  randomizer & rng;
  std::vector<std::string> lines;
  std::string prefix;

  file_randomizer(randomizer & rng)
    : rng(rng)
  {}

  size_t random_index(bool last_line_ok = true)
  {
    if (last_line_ok)
      return static_cast<size_t>(rng.uniform(lines.size() + 1));
    else
      {
        if (lines.size() == 0)
          return 0;
        else
          return static_cast<size_t>(rng.uniform(lines.size()));
      }
  }

  void set_prefix(std::string const & p)
  {
    prefix = p;
  }

  void append_to(std::vector<std::string> & other)
  {
    for (std::vector<std::string>::const_iterator i = lines.begin();
         i != lines.end(); ++i)
      other.push_back(prefix + *i);
  }

  void initial_trade_lines(int num_lines = 10)
  {
    lines.clear();
    for (int i = 0; i < num_lines; ++i)
      lines.push_back(std::string("<Trade tradeID=\"")
                      + boost::lexical_cast<std::string>(i)
                      + "\" quantity=\"100\"/>\n");
  }

  void delete_percent_of_lines_randomly(int percent = 50)
  {
    double scale = static_cast<double>(percent) / 100.0;
    int nlines = static_cast<int>(static_cast<double>(lines.size()) * scale);
    for (int i = 0; i < nlines && !lines.empty(); ++i)
      lines.erase(lines.begin() + random_index(false));
  }

  void insert_percent_of_lines_randomly(int percent = 50)
  {
    double scale = static_cast<double>(percent) / 100.0;
    int nlines = static_cast<int>(static_cast<double>(lines.size()) * scale);
    for (int i = 0; i < nlines; ++i)
      lines.insert(lines.begin() + random_index(),
                   std::string("<Insert n=\"")
                   + boost::lexical_cast<std::string>(i) + "\"/>\n");
  }

  // rewrite some lines in place, as a changed field would
  void modify_percent_of_lines_randomly(int percent = 30)
  {
    for (std::vector<std::string>::iterator i = lines.begin();
         i != lines.end(); ++i)
      if (rng.uniform(100) < static_cast<size_t>(percent))
        *i = std::string("<Changed/>") + *i;
  }

  // OLDER and NEWER get N_SECTIONS blocks of lines each; every block is
  // left alone, grown, shrunk or edited in NEWER.  either text may lose
  // its final newline.
  static void build_random_revision(std::vector<std::string> & older,
                                    std::vector<std::string> & newer,
                                    int n_sections,
                                    randomizer & rng)
  {
    older.clear();
    newer.clear();

    for (int s = 0; s < n_sections; ++s)
      {
        file_randomizer fr(rng);
        fr.set_prefix(std::string("<Section n=\"")
                      + boost::lexical_cast<std::string>(s) + "\"/>");
        fr.initial_trade_lines(1 + static_cast<int>(rng.uniform(10)));
        fr.append_to(older);
        switch (rng.uniform(4))
          {
          case 0:
            break;
          case 1:
            fr.insert_percent_of_lines_randomly();
            break;
          case 2:
            fr.delete_percent_of_lines_randomly();
            break;
          default:
            fr.modify_percent_of_lines_randomly();
            break;
          }
        fr.append_to(newer);
      }

    strip_final_newline_maybe(older, rng);
    strip_final_newline_maybe(newer, rng);
  }

  static void strip_final_newline_maybe(std::vector<std::string> & text,
                                        randomizer & rng)
  {
    if (!text.empty() && rng.flip(4))
      {
        std::string & last = text.back();
        if (!last.empty() && last[last.size() - 1] == '\n')
          last.erase(last.size() - 1);
      }
  }
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __RANDOMFILE_HH__
