#include <iostream>
#include <vector>

#include "test_helper.h"
#include "../snapshot.h"
#include "../chunk_planner.h"
#include "../errors.h"
#include "../logger.h"

static SnapshotLayout_t MakeLayout(int nfiles, const vector <HPInt> &counts)
{
  SnapshotLayout_t layout;
  layout.SetCounts(nfiles, counts);
  return layout;
}

static void CheckCoverage(const SnapshotLayout_t &layout, HPInt nr_chunks)
/*every particle is in exactly one chunk, and each slice maps back to the right global indices*/
{
  vector <int> hits(layout.NumberOfParticles, 0);
  vector <Chunk_t> chunks=PlanChunks(layout, nr_chunks);
  CHECK_EQUAL((HPInt)chunks.size(), nr_chunks);
  HPInt smallest=layout.NumberOfParticles, largest=0, expected_begin=0;
  for(auto &&chunk: chunks)
  {
	CHECK_EQUAL(chunk.Begin, expected_begin);
	expected_begin=chunk.End;
	CHECK(chunk.size()>0);
	smallest=min(smallest, chunk.size());
	largest=max(largest, chunk.size());
	HPInt nslice=0;
	for(auto &&slice: chunk.Slices)
	{
	  CHECK(slice.Count>0);
	  CHECK(slice.Offset+slice.Count<=layout.GetCount(slice.File, slice.Type));
	  CHECK_EQUAL(slice.GlobalBegin, layout.GetOffset(slice.File, slice.Type)+slice.Offset);
	  for(HPInt i=0;i<slice.Count;i++)
		hits[slice.GlobalBegin+i]++;
	  nslice+=slice.Count;
	}
	CHECK_EQUAL(nslice, chunk.size());
  }
  CHECK_EQUAL(expected_begin, layout.NumberOfParticles);
  CHECK(largest-smallest<=1);
  for(auto &&h: hits)
	if(h!=1)
	{
	  CHECK_EQUAL(h, 1);
	  break;
	}
}

int main(int argc, char **argv)
{
  {//native order is file by file, type by type
	vector <HPInt> counts(3*TypeMax, 0);
	counts[0*TypeMax+TypeGas]=5;
	counts[0*TypeMax+TypeDM]=7;
	counts[1*TypeMax+TypeDM]=0;
	counts[2*TypeMax+TypeGas]=3;
	counts[2*TypeMax+TypeStar]=4;
	counts[2*TypeMax+TypeBH]=1;
	SnapshotLayout_t layout=MakeLayout(3, counts);
	CHECK_EQUAL(layout.NumberOfParticles, 20);
	CHECK_EQUAL(layout.GetOffset(0, TypeDM), 5);
	CHECK_EQUAL(layout.GetOffset(2, TypeGas), 12);
	CHECK_EQUAL(layout.GetOffset(2, TypeBH), 19);
	CHECK_EQUAL(layout.Header.NumPartTotal[TypeGas], 8);

	for(HPInt nr_chunks=1;nr_chunks<=layout.NumberOfParticles;nr_chunks++)
	  CheckCoverage(layout, nr_chunks);

	Chunk_t chunk=PlanChunk(layout, 2, 1);
	CHECK_EQUAL(chunk.Begin, 10);
	CHECK_EQUAL(chunk.End, 20);
	CHECK_EQUAL(chunk.Slices.size(), 4);
	CHECK_EQUAL(chunk.Slices[0].File, 0);
	CHECK_EQUAL(chunk.Slices[0].Type, TypeDM);
	CHECK_EQUAL(chunk.Slices[0].Offset, 5);
	CHECK_EQUAL(chunk.Slices[0].Count, 2);
	vector <int> files=chunk.GetFiles();
	CHECK_EQUAL(files.size(), 2);
	CHECK_EQUAL(files[0], 0);
	CHECK_EQUAL(files[1], 2);

	//the plan is a pure function of the layout, so any rank can rebuild a chunk from its id
	Chunk_t again=PlanChunk(layout, 2, 1);
	CHECK_EQUAL(again.Slices.size(), chunk.Slices.size());
	CHECK_EQUAL(again.Slices.back().GlobalBegin, chunk.Slices.back().GlobalBegin);
  }

  {//two files of ten particles each
	vector <HPInt> counts(2*TypeMax, 0);
	counts[0*TypeMax+TypeDM]=10;
	counts[1*TypeMax+TypeDM]=10;
	SnapshotLayout_t layout=MakeLayout(2, counts);
	Chunk_t first=PlanChunk(layout, 2, 0), second=PlanChunk(layout, 2, 1);
	CHECK_EQUAL(first.GetFiles().size(), 1);
	CHECK_EQUAL(first.GetFiles()[0], 0);
	CHECK_EQUAL(second.GetFiles()[0], 1);
	for(HPInt nr_chunks: {1, 3, 7, 19, 20})
	  CheckCoverage(layout, nr_chunks);

	CHECK_THROW(CheckChunkPlan(layout, 0), ConfigurationError_t);
	CHECK_THROW(CheckChunkPlan(layout, -3), ConfigurationError_t);
	CHECK_THROW(CheckChunkPlan(layout, 21), ConfigurationError_t);
	CHECK_THROW(PlanChunk(layout, 2, 2), ConfigurationError_t);
	CHECK_THROW(PlanChunks(layout, 0), ConfigurationError_t);
  }

  {//a large layout with many files, chunked coarsely
	vector <HPInt> counts(16*TypeMax, 0);
	for(int ifile=0;ifile<16;ifile++)
	{
	  counts[ifile*TypeMax+TypeGas]=1000+ifile;
	  counts[ifile*TypeMax+TypeDM]=1500;
	  counts[ifile*TypeMax+TypeNeutrino]=ifile%3;
	}
	SnapshotLayout_t layout=MakeLayout(16, counts);
	for(HPInt nr_chunks: {1, 2, 5, 16, 17, 64, 1001})
	  CheckCoverage(layout, nr_chunks);
  }

  CHECK_THROW(MakeLayout(2, vector <HPInt>(TypeMax, 1)), ReadError_t);

  return TestReport("test_chunk_planner");
}
