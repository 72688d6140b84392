#ifndef LOGGER_H_INCLUDED
#define LOGGER_H_INCLUDED

#include <iostream>
#include <string>

#include "datatypes.h"

enum class LogLevel_t: int
{
  Debug=0,
  Info,
  Warning,
  Error
};

class Logger_t
/* rank-aware console log.
 * messages below the threshold go to a null stream; warnings and errors go to cerr.
 * lines from ranks other than 0 are prefixed with the rank.*/
{
  LogLevel_t Threshold;
  int Rank;
  ostream NullStream;
public:
  Logger_t(): Threshold(LogLevel_t::Info), Rank(0), NullStream(nullptr)
  {
  }
  void SetRank(int rank)
  {
	Rank=rank;
  }
  void SetThreshold(LogLevel_t level)
  {
	Threshold=level;
  }
  LogLevel_t GetThreshold() const
  {
	return Threshold;
  }
  bool Enabled(LogLevel_t level) const
  {
	return level>=Threshold;
  }
  ostream & operator()(LogLevel_t level);
  ostream & Root(LogLevel_t level);//only rank 0 prints
};

extern Logger_t HPLog;
extern LogLevel_t ParseLogLevel(const string &name);
extern string LogLevelName(LogLevel_t level);

#endif
