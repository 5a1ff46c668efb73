// every command line option, in the form
//
//   OPT(member, "long,s", type, default, description)
//   #ifdef option_bodies
//   { body run with the argument in 'arg' }
//   #endif
//
// the includer defines OPT; options.cc defines option_bodies as well.

OPT(args, "--", args_vector, ,
    "")
#ifdef option_bodies
{
  args.push_back(arg);
}
#endif

OPT(date, "date", date_t, ,
    N_("archive or restore the snapshot for this day (YYYY-MM-DD)"))
#ifdef option_bodies
{
  try
    {
      date = date_t::from_string(arg);
    }
  catch (std::exception & e)
    {
      throw bad_arg_internal(e.what());
    }
}
#endif

OPT(debug, "debug", bool, false,
    N_("print debug log to stderr while running"))
#ifdef option_bodies
{
  debug = true;
  global_sanity.set_debug();
}
#endif

OPT(dir, "dir", std::string, ,
    N_("archive directory"))
#ifdef option_bodies
{
  if (arg.empty())
    throw bad_arg_internal(F("cannot be empty").str());
  dir = arg;
}
#endif

OPT(dump, "dump", std::string, ,
    N_("file to dump debugging log to, on failure"))
#ifdef option_bodies
{
  dump = arg;
  global_sanity.set_dump_path(arg);
}
#endif

OPT(help, "help,h", bool, false,
    N_("display help message"))
#ifdef option_bodies
{
  help = true;
}
#endif

OPT(keep_bases, "keep-bases", bool, false,
    N_("keep older bases when a new one is written"))
#ifdef option_bodies
{
  keep_bases = true;
}
#endif

OPT(log, "log", std::string, ,
    N_("file to write the log to"))
#ifdef option_bodies
{
  log = arg;
}
#endif

OPT(output, "output,o", std::string, ,
    N_("write a restored snapshot to this file"))
#ifdef option_bodies
{
  output = arg;
}
#endif

OPT(quiet, "quiet,q", bool, false,
    N_("suppress verbose, informational and progress messages"))
#ifdef option_bodies
{
  quiet = true;
  global_sanity.set_quiet();
}
#endif

OPT(version, "version", bool, false,
    N_("print version number, then exit"))
#ifdef option_bodies
{
  version = true;
}
#endif

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
