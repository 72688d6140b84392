#include <sstream>
#include <iomanip>
#include <cctype>

#include "path_template.h"
#include "errors.h"

void PathTemplate_t::Parse(const string &pattern)
{
  Pattern=pattern;
  Tokens.clear();
  if(pattern.empty())
	throw ConfigurationError_t("empty path template");

  string literal;
  size_t i=0, n=pattern.size();
  while(i<n)
  {
	char c=pattern[i];
	if(c!='%')
	{
	  literal.push_back(c);
	  i++;
	  continue;
	}
	if(i+1<n&&pattern[i+1]=='%')
	{
	  literal.push_back('%');
	  i+=2;
	  continue;
	}
	if(i+1>=n||pattern[i+1]!='(')
	  throw ConfigurationError_t("bad placeholder at position "+to_string(i)+" in path template "+pattern+"; expect %(snap_nr)d or %(file_nr)d");
	size_t close=pattern.find(')', i+2);
	if(close==string::npos)
	  throw ConfigurationError_t("unterminated placeholder in path template "+pattern);
	string name=pattern.substr(i+2, close-i-2);
	Token_t token;
	if(name=="snap_nr")
	  token.Kind=TokenKind_t::SnapNr;
	else if(name=="file_nr")
	  token.Kind=TokenKind_t::FileNr;
	else
	  throw ConfigurationError_t("unknown placeholder "+name+" in path template "+pattern);
	size_t j=close+1;
	token.ZeroPad=false;
	token.Width=0;
	if(j<n&&pattern[j]=='0')
	{
	  token.ZeroPad=true;
	  j++;
	}
	while(j<n&&isdigit(pattern[j]))
	{
	  token.Width=token.Width*10+(pattern[j]-'0');
	  j++;
	}
	if(j>=n||pattern[j]!='d')
	  throw ConfigurationError_t("placeholder "+name+" in path template "+pattern+" must be an integer conversion (d)");
	if(!literal.empty())
	{
	  Tokens.push_back(Token_t{TokenKind_t::Literal, literal, 0, false});
	  literal.clear();
	}
	Tokens.push_back(token);
	i=j+1;
  }
  if(!literal.empty())
	Tokens.push_back(Token_t{TokenKind_t::Literal, literal, 0, false});
}

bool PathTemplate_t::Has(TokenKind_t kind) const
{
  for(auto &&t: Tokens)
	if(t.Kind==kind) return true;
  return false;
}

string PathTemplate_t::Build(int snap_nr, int file_nr) const
{
  stringstream formatter;
  for(auto &&t: Tokens)
  {
	if(t.Kind==TokenKind_t::Literal)
	{
	  formatter<<t.Text;
	  continue;
	}
	int value=(t.Kind==TokenKind_t::SnapNr)?snap_nr:file_nr;
	formatter<<setw(t.Width)<<setfill(t.ZeroPad?'0':' ')<<value;
  }
  return formatter.str();
}
