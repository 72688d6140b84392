/* typed file name templates.
 *
 * A template is a path with python-style placeholders, e.g.
 *   snapshots/flamingo_%(snap_nr)04d/flamingo_%(snap_nr)04d.%(file_nr)d.hdf5
 * Only snap_nr and file_nr are recognised; the only conversion is an integer (d) with an optional
 * zero-pad flag and width. "%%" is a literal '%'.
 * Templates are validated once when parsed, and Build() never fails afterwards.
 */
#ifndef PATH_TEMPLATE_H_INCLUDED
#define PATH_TEMPLATE_H_INCLUDED

#include <string>
#include <vector>

#include "datatypes.h"

class PathTemplate_t
{
  enum class TokenKind_t
  {
	Literal,
	SnapNr,
	FileNr
  };
  struct Token_t
  {
	TokenKind_t Kind;
	string Text;
	int Width;
	bool ZeroPad;
  };
  string Pattern;
  vector <Token_t> Tokens;
  bool Has(TokenKind_t kind) const;
public:
  PathTemplate_t()
  {
  }
  explicit PathTemplate_t(const string &pattern)
  {
	Parse(pattern);
  }
  void Parse(const string &pattern);
  string Build(int snap_nr, int file_nr=0) const;
  bool HasSnapshotNumber() const
  {
	return Has(TokenKind_t::SnapNr);
  }
  bool HasFileNumber() const
  {
	return Has(TokenKind_t::FileNr);
  }
  bool empty() const
  {
	return Pattern.empty();
  }
  const string & GetPattern() const
  {
	return Pattern;
  }
};

#endif
