#include "logger.h"
#include "errors.h"

Logger_t HPLog;

ostream & Logger_t::operator()(LogLevel_t level)
{
  if(!Enabled(level))
	return NullStream;
  ostream &os=(level>=LogLevel_t::Warning)?cerr:cout;
  if(Rank) os<<"[rank "<<Rank<<"] ";
  if(level==LogLevel_t::Warning) os<<"Warning: ";
  else if(level==LogLevel_t::Error) os<<"Error: ";
  return os;
}

ostream & Logger_t::Root(LogLevel_t level)
{
  if(Rank) return NullStream;
  return (*this)(level);
}

LogLevel_t ParseLogLevel(const string &name)
{
  if(name=="debug") return LogLevel_t::Debug;
  if(name=="info") return LogLevel_t::Info;
  if(name=="warning") return LogLevel_t::Warning;
  if(name=="error") return LogLevel_t::Error;
  throw ConfigurationError_t("unknown LogLevel "+name+" (expect debug, info, warning or error)");
}

string LogLevelName(LogLevel_t level)
{
  switch(level)
  {
	case LogLevel_t::Debug: return "debug";
	case LogLevel_t::Info: return "info";
	case LogLevel_t::Warning: return "warning";
	case LogLevel_t::Error: return "error";
  }
  return "info";
}
