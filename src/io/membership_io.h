/* IO for group membership files (the extra input).
 *
 * The membership files are sharded exactly like the snapshot: file N carries, for every particle of snapshot file N,
 * the id of the halo the particle is bound to, in /PartTypeM/GroupNr_bound (-1 if the particle is not bound to any halo).
 * The rows follow the snapshot rows, so the join key is the global particle index.
 */
#ifndef MEMBERSHIP_IO_INCLUDED
#define MEMBERSHIP_IO_INCLUDED

#include "../hdf_wrapper.h"
#include "../config_parser.h"

namespace Membership
{
  extern string GetFileName(const Parameter_t &config, int ifile);
  extern hid_t OpenFile(const Parameter_t &config, int ifile);
  extern void CheckLength(hid_t file, int itype, HPInt expected_length);
  extern void ReadGroupNr(hid_t file, int itype, HPInt offset, HPInt count, HPInt *groupnr);
}

#endif
