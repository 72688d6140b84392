#include <iostream>
#include <string>

#include "membership_io.h"
#include "../snapshot.h"

namespace Membership
{
string GetFileName(const Parameter_t &config, int ifile)
{
  return config.MembershipPath.Build(config.SnapshotNumber, ifile);
}

hid_t OpenFile(const Parameter_t &config, int ifile)
{
  return OpenFileForRead(GetFileName(config, ifile));
}

void CheckLength(hid_t file, int itype, HPInt expected_length)
/*a type absent from the membership file is only allowed when the snapshot has no particles of that type either*/
{
  string dataset=string(PartTypeGroupName(itype))+"/GroupNr_bound";
  HPInt len=0;
  if(H5Lexists(file, PartTypeGroupName(itype), H5P_DEFAULT)>0&&DatasetExists(file, dataset.c_str()))
	len=GetDatasetLength(file, dataset.c_str());
  if(len!=expected_length)
  {
	stringstream msg;
	msg<<"membership file "<<GetObjectPath(file)<<" has "<<len<<" rows in "<<dataset<<", but the snapshot has "<<expected_length<<" particles";
	throw ReadError_t(msg.str());
  }
}

void ReadGroupNr(hid_t file, int itype, HPInt offset, HPInt count, HPInt *groupnr)
{
  string dataset=string(PartTypeGroupName(itype))+"/GroupNr_bound";
  ReadPartialDataset(file, dataset.c_str(), H5T_HPInt, offset, count, groupnr);
  for(HPInt i=0;i<count;i++)
	if(groupnr[i]<0) groupnr[i]=SpecialConst::NullHaloId;
}
}
