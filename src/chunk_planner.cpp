#include <iostream>
#include <sstream>
#include <algorithm>

#include "chunk_planner.h"
#include "mymath.h"
#include "errors.h"

vector <int> Chunk_t::GetFiles() const
{
  vector <int> files;
  for(auto &&s: Slices)
	if(files.empty()||files.back()!=s.File)
	  files.push_back(s.File);
  return files;
}

void CheckChunkPlan(const SnapshotLayout_t &layout, HPInt nr_chunks)
{
  if(nr_chunks<=0)
	throw ConfigurationError_t("number of chunks must be positive, got "+to_string(nr_chunks));
  if(layout.NumberOfParticles<nr_chunks)
  {
	stringstream msg;
	msg<<"cannot divide "<<layout.NumberOfParticles<<" particles into "<<nr_chunks<<" non-empty chunks";
	throw ConfigurationError_t(msg.str());
  }
}

Chunk_t PlanChunk(const SnapshotLayout_t &layout, HPInt nr_chunks, HPInt ichunk)
{
  CheckChunkPlan(layout, nr_chunks);
  if(ichunk<0||ichunk>=nr_chunks)
	throw ConfigurationError_t("chunk "+to_string(ichunk)+" out of range");

  Chunk_t chunk;
  chunk.ChunkId=ichunk;
  AssignTasks(ichunk, nr_chunks, layout.NumberOfParticles, chunk.Begin, chunk.End);

  for(int ifile=0;ifile<layout.GetNumberOfFiles();ifile++)
	for(int itype=0;itype<TypeMax;itype++)
	{
	  HPInt block_begin=layout.GetOffset(ifile, itype);
	  HPInt block_end=block_begin+layout.GetCount(ifile, itype);
	  HPInt begin=max(block_begin, chunk.Begin), end=min(block_end, chunk.End);
	  if(begin>=end) continue;
	  FileSlice_t slice;
	  slice.File=ifile;
	  slice.Type=itype;
	  slice.Offset=begin-block_begin;
	  slice.Count=end-begin;
	  slice.GlobalBegin=begin;
	  chunk.Slices.push_back(slice);
	}
  return chunk;
}

vector <Chunk_t> PlanChunks(const SnapshotLayout_t &layout, HPInt nr_chunks)
{
  CheckChunkPlan(layout, nr_chunks);
  vector <Chunk_t> chunks;
  chunks.reserve(nr_chunks);
  for(HPInt i=0;i<nr_chunks;i++)
	chunks.push_back(PlanChunk(layout, nr_chunks, i));
  return chunks;
}
