/* distribution of chunks over MPI ranks.
 *
 * With more than one rank, rank 0 only coordinates: it hands out chunk ids, owns the pool of reader tokens that caps
 * the number of ranks reading the snapshot at the same time, and merges the partial results sent back by the workers.
 * With a single rank the chunks are processed in turn by that rank.
 *
 * Message protocol between the coordinator (rank 0) and a worker:
 *   TagAssign        coordinator -> worker  chunk id, or a stop signal
 *   TagTokenRequest  worker -> coordinator  before opening any snapshot file
 *   TagTokenGrant    coordinator -> worker
 *   TagTokenRelease  worker -> coordinator  once the particle stream is drained
 *   TagResultHeader  worker -> coordinator  ChunkReport_t, followed by
 *   TagResultData    worker -> coordinator  the partial sums (empty on failure), and
 *   TagResultMessage worker -> coordinator  the failure message (empty on success)
 */
#ifndef COORDINATOR_H_INCLUDED
#define COORDINATOR_H_INCLUDED

#include <vector>
#include <deque>
#include <set>
#include <map>
#include <mutex>
#include <string>
#include <chrono>
#include <memory>

#include "datatypes.h"
#include "mpi_wrapper.h"
#include "config_parser.h"
#include "snapshot.h"
#include "chunk_planner.h"
#include "halo.h"
#include "halo_grid.h"
#include "halo_property.h"
#include "chunk_aggregator.h"

enum MessageTag_t: int
{
  TagAssign=100,
  TagTokenRequest,
  TagTokenGrant,
  TagTokenRelease,
  TagResultHeader,
  TagResultData,
  TagResultMessage
};

namespace SpecialConst
{
  const HPInt StopChunkId=-1;//no more work
  const HPInt AbortChunkId=-2;//no more work, the run has failed
}

enum class WorkerState_t: int
{
  Idle,
  Assigned,
  Reading,
  Aggregating,
  Reporting
};
extern const char *WorkerStateName(WorkerState_t state);

class WorkerStatus_t
/* the state of one worker, as seen by whoever drives it.
 * Idle -> Assigned -> Reading -> Aggregating -> Reporting -> Idle; a failure jumps straight to Reporting.*/
{
  WorkerState_t State;
  HPInt ChunkId;
  chrono::steady_clock::time_point AssignTime;
public:
  bool Lost;//missed its deadline; its chunk has been handed to another worker
  WorkerStatus_t(): State(WorkerState_t::Idle), ChunkId(SpecialConst::NullChunkId), Lost(false)
  {
  }
  void Transit(WorkerState_t next);
  void Assign(HPInt chunk_id);
  WorkerState_t GetState() const
  {
	return State;
  }
  HPInt GetChunk() const
  {
	return ChunkId;
  }
  bool IsBusy() const
  {
	return State!=WorkerState_t::Idle;
  }
  double SecondsSinceAssigned() const
  {
	return chrono::duration_cast<chrono::duration<double> >(chrono::steady_clock::now()-AssignTime).count();
  }
};

class ReaderGate_t
/*entry to the snapshot files, limited to a number of concurrent readers*/
{
public:
  virtual ~ReaderGate_t()
  {
  }
  virtual void Acquire()=0;
  virtual void Release()=0;
};

class ReaderToken_t
/*holds the gate for its lifetime*/
{
  ReaderGate_t &Gate;
  bool Held;
public:
  explicit ReaderToken_t(ReaderGate_t &gate): Gate(gate), Held(false)
  {
	Gate.Acquire();
	Held=true;
  }
  ~ReaderToken_t()
  {
	Release();
  }
  void Release()
  {
	if(Held)
	{
	  Held=false;
	  Gate.Release();
	}
  }
  ReaderToken_t(const ReaderToken_t &)=delete;
  ReaderToken_t & operator=(const ReaderToken_t &)=delete;
};

class ReaderTokenPool_t
/* counting semaphore over reader tokens, kept by the coordinator.
 * requests beyond the capacity wait in a first-come first-served queue.*/
{
  int Capacity;
  set <int> Holders;
  deque <int> Waiting;
  int PeakHolders;
public:
  explicit ReaderTokenPool_t(int capacity): Capacity(capacity), PeakHolders(0)
  {
  }
  bool Request(int rank);//true if granted immediately, otherwise rank is queued
  int Release(int rank);//returns the rank granted the freed token, or -1
  int NumberOfHolders() const
  {
	return Holders.size();
  }
  int NumberWaiting() const
  {
	return Waiting.size();
  }
  int GetPeakHolders() const
  {
	return PeakHolders;
  }
};

class LocalReaderGate_t: public ReaderGate_t
{
  ReaderTokenPool_t &Pool;
  int Rank;
public:
  LocalReaderGate_t(ReaderTokenPool_t &pool, int rank): Pool(pool), Rank(rank)
  {
  }
  void Acquire();
  void Release();
};

class MpiReaderGate_t: public ReaderGate_t
{
  MpiWorker_t &World;
  int Coordinator;
public:
  MpiReaderGate_t(MpiWorker_t &world, int coordinator): World(world), Coordinator(coordinator)
  {
  }
  void Acquire();
  void Release();
};

enum class FailureKind_t: int
{
  None=0,
  Recoverable,//read errors and worker failures; the chunk is retried
  Fatal
};

enum class ErrorCode_t: int
{
  None=0,
  InconsistentAssignment,
  WorkerFailure,
  ReadFailure,
  Other
};

struct ChunkReport_t
{
  HPInt ChunkId;
  int Status;//FailureKind_t
  int Error;//ErrorCode_t
  HPInt NumberOfRecords;
  HPInt NumberOfParticles;
  HPInt NumberOfSkippedParticles;
  HPInt ParticleIndex;//for inconsistent assignments
  HPInt HaloId;
};
extern void create_MPI_ChunkReport_type(MPI_Datatype &dtype);

struct ChunkResult_t
{
  ChunkReport_t Report;
  vector <HaloAccumulator_t> Partial;
  string Message;
  void Reset(HPInt chunk_id);
};

class ChunkTask_t
/* the work done on one chunk.
 * Read() runs while the worker holds a reader token, and must feed every particle of the chunk to the aggregator.*/
{
public:
  virtual ~ChunkTask_t()
  {
  }
  virtual void Read(const Chunk_t &chunk, ChunkAggregator_t &aggregator)=0;
  virtual void Aggregate(ChunkAggregator_t &aggregator, ChunkResult_t &result);
  virtual ChunkAggregator_t * NewAggregator()=0;
};

class SnapshotChunkTask_t: public ChunkTask_t
{
protected:
  const SnapshotLayout_t &Layout;
  const HaloCatalogue_t &Catalogue;
  const Parameter_t &Config;
  HaloGrid_t Grid;
public:
  SnapshotChunkTask_t(const SnapshotLayout_t &layout, const HaloCatalogue_t &catalogue, const Parameter_t &config);
  void Read(const Chunk_t &chunk, ChunkAggregator_t &aggregator);
  ChunkAggregator_t * NewAggregator();
};

class GlobalAccumulator_t
/* the merged sums of every halo.
 * partial results may arrive in any order; they are applied strictly in chunk order, so that the final sums do not
 * depend on which worker finished first. Results for a chunk already received are discarded.*/
{
  mutex Mutex;
  HPInt NumberOfChunks;
  HPInt NextChunk;
  map <HPInt, vector <HaloAccumulator_t> > Pending;
  vector <bool> Received;
  void Apply(const vector <HaloAccumulator_t> &partial);
public:
  vector <HaloAccumulator_t> Halos;
  GlobalAccumulator_t(HPInt nhalos, HPInt nchunks);
  bool Merge(HPInt chunk_id, vector <HaloAccumulator_t> &partial);
  bool IsComplete();
  bool HasChunk(HPInt chunk_id);
  HPInt NumberMerged();
};

class FailureReport_t
{
public:
  ErrorCode_t Error;
  string Message;
  HPInt ParticleIndex, HaloId;
  FailureReport_t(): Error(ErrorCode_t::None), ParticleIndex(-1), HaloId(-1)
  {
  }
  bool Failed() const
  {
	return Error!=ErrorCode_t::None;
  }
  void Broadcast(MpiWorker_t &world, int root);
  void Raise() const;
};

class Coordinator_t
{
  MpiWorker_t &World;
  const Parameter_t &Config;
  const SnapshotLayout_t &Layout;
  ChunkTask_t &Task;
  GlobalAccumulator_t &Global;
  HPInt NumberOfChunks;
  MPI_Datatype MPI_ChunkReport_t, MPI_HaloAccumulator_t;
  vector <WorkerStatus_t> Workers;
  vector <int> Attempts;
  FailureReport_t Failure;

  void ProcessChunk(HPInt chunk_id, ReaderGate_t &gate, WorkerStatus_t &status, ChunkResult_t &result);
  bool HandleResult(ChunkResult_t &result, bool stale, deque <HPInt> &queue);
  void Dispatch(deque <HPInt> &queue);
  void CheckDeadlines(deque <HPInt> &queue);
  bool IsAnyWorkerBusy() const;
  void RunCoordinator();
  void RunWorker();
  void RunLocal();
public:
  RunSummary_t Summary;
  int PeakReaders;
  Coordinator_t(MpiWorker_t &world, const Parameter_t &config, const SnapshotLayout_t &layout, ChunkTask_t &task, GlobalAccumulator_t &global);
  ~Coordinator_t();
  void Run();
  static const int CoordinatorRank=0;
};

#endif
