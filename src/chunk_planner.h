/* division of the particles of a snapshot into chunks.
 *
 * chunk i covers the global index range [Begin, End) given by AssignTasks(i, nr_chunks, NumberOfParticles),
 * so chunks are contiguous, disjoint and cover every particle exactly once, with sizes differing by at most one.
 * the plan is a pure function of the layout and nr_chunks, so every rank can rebuild any chunk from its id alone.
 */
#ifndef CHUNK_PLANNER_H_INCLUDED
#define CHUNK_PLANNER_H_INCLUDED

#include <vector>

#include "datatypes.h"
#include "snapshot.h"

struct Chunk_t
{
  HPInt ChunkId;
  HPInt Begin, End;
  vector <FileSlice_t> Slices;
  HPInt size() const
  {
	return End-Begin;
  }
  vector <int> GetFiles() const;//snapshot files touched by this chunk, in increasing order
};

extern void CheckChunkPlan(const SnapshotLayout_t &layout, HPInt nr_chunks);
extern Chunk_t PlanChunk(const SnapshotLayout_t &layout, HPInt nr_chunks, HPInt ichunk);
extern vector <Chunk_t> PlanChunks(const SnapshotLayout_t &layout, HPInt nr_chunks);

#endif
