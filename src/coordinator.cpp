#include <iostream>
#include <sstream>
#include <algorithm>
#include <thread>

#include "coordinator.h"
#include "errors.h"
#include "logger.h"

const char *WorkerStateName(WorkerState_t state)
{
  switch(state)
  {
	case WorkerState_t::Idle: return "idle";
	case WorkerState_t::Assigned: return "assigned";
	case WorkerState_t::Reading: return "reading";
	case WorkerState_t::Aggregating: return "aggregating";
	case WorkerState_t::Reporting: return "reporting";
  }
  return "unknown";
}

void WorkerStatus_t::Transit(WorkerState_t next)
{
  bool valid;
  switch(next)
  {
	case WorkerState_t::Idle:
	  valid=(State==WorkerState_t::Reporting);
	  break;
	case WorkerState_t::Assigned:
	  valid=(State==WorkerState_t::Idle);
	  break;
	case WorkerState_t::Reading:
	  valid=(State==WorkerState_t::Assigned);
	  break;
	case WorkerState_t::Aggregating:
	  valid=(State==WorkerState_t::Reading);
	  break;
	case WorkerState_t::Reporting:
	  valid=(State!=WorkerState_t::Idle&&State!=WorkerState_t::Reporting);
	  break;
	default:
	  valid=false;
  }
  if(!valid)
	throw runtime_error(string("invalid worker state transition from ")+WorkerStateName(State)+" to "+WorkerStateName(next));
  State=next;
  if(State==WorkerState_t::Idle)
  {
	ChunkId=SpecialConst::NullChunkId;
	Lost=false;
  }
}

void WorkerStatus_t::Assign(HPInt chunk_id)
{
  Transit(WorkerState_t::Assigned);
  ChunkId=chunk_id;
  AssignTime=chrono::steady_clock::now();
}

bool ReaderTokenPool_t::Request(int rank)
{
  if(Holders.count(rank))
	throw runtime_error("rank "+to_string(rank)+" requested a second reader token");
  if((int)Holders.size()<Capacity)
  {
	Holders.insert(rank);
	PeakHolders=max(PeakHolders, (int)Holders.size());
	return true;
  }
  Waiting.push_back(rank);
  return false;
}

int ReaderTokenPool_t::Release(int rank)
{
  if(!Holders.erase(rank))
  {//not a holder; drop any pending request instead
	auto it=find(Waiting.begin(), Waiting.end(), rank);
	if(it!=Waiting.end())
	  Waiting.erase(it);
	return -1;
  }
  if(Waiting.empty())
	return -1;
  int next=Waiting.front();
  Waiting.pop_front();
  Holders.insert(next);
  PeakHolders=max(PeakHolders, (int)Holders.size());
  return next;
}

void LocalReaderGate_t::Acquire()
{
  if(!Pool.Request(Rank))
  {
	Pool.Release(Rank);
	throw WorkerFailure_t("no reader token available for a local reader");
  }
}
void LocalReaderGate_t::Release()
{
  Pool.Release(Rank);
}

void MpiReaderGate_t::Acquire()
{
  int dummy=World.rank();
  MPI_Send(&dummy, 1, MPI_INT, Coordinator, TagTokenRequest, World.Communicator);
  MPI_Recv(&dummy, 1, MPI_INT, Coordinator, TagTokenGrant, World.Communicator, MPI_STATUS_IGNORE);
}
void MpiReaderGate_t::Release()
{
  int dummy=World.rank();
  MPI_Send(&dummy, 1, MPI_INT, Coordinator, TagTokenRelease, World.Communicator);
}

void create_MPI_ChunkReport_type(MPI_Datatype &dtype)
{
  ChunkReport_t p;
  #define NumAttr 8
  MPI_Datatype oldtypes[NumAttr];
  int blockcounts[NumAttr];
  MPI_Aint   offsets[NumAttr], origin,extent;

  MPI_Get_address(&p,&origin);
  MPI_Get_address((&p)+1,&extent);//to get the extent of s
  extent-=origin;

  int i=0;
  #define RegisterAttr(x, type, count) {MPI_Get_address(&(p.x), offsets+i); offsets[i]-=origin; oldtypes[i]=type; blockcounts[i]=count; i++;}
  RegisterAttr(ChunkId, MPI_HP_INT, 1)
  RegisterAttr(Status, MPI_INT, 1)
  RegisterAttr(Error, MPI_INT, 1)
  RegisterAttr(NumberOfRecords, MPI_HP_INT, 1)
  RegisterAttr(NumberOfParticles, MPI_HP_INT, 1)
  RegisterAttr(NumberOfSkippedParticles, MPI_HP_INT, 1)
  RegisterAttr(ParticleIndex, MPI_HP_INT, 1)
  RegisterAttr(HaloId, MPI_HP_INT, 1)
  #undef RegisterAttr

  MPI_Type_create_struct(i,blockcounts,offsets,oldtypes, &dtype);
  MPI_Type_create_resized(dtype,(MPI_Aint)0, extent, &dtype);
  MPI_Type_commit(&dtype);
  #undef NumAttr
}

void ChunkResult_t::Reset(HPInt chunk_id)
{
  Report.ChunkId=chunk_id;
  Report.Status=(int)FailureKind_t::None;
  Report.Error=(int)ErrorCode_t::None;
  Report.NumberOfRecords=0;
  Report.NumberOfParticles=0;
  Report.NumberOfSkippedParticles=0;
  Report.ParticleIndex=-1;
  Report.HaloId=-1;
  Partial.clear();
  Message.clear();
}

void ChunkTask_t::Aggregate(ChunkAggregator_t &aggregator, ChunkResult_t &result)
{
  result.Report.NumberOfParticles=aggregator.NumberOfParticles;
  result.Report.NumberOfSkippedParticles=aggregator.NumberOfSkippedParticles;
  aggregator.Finish(result.Partial);
  result.Report.NumberOfRecords=result.Partial.size();
}

SnapshotChunkTask_t::SnapshotChunkTask_t(const SnapshotLayout_t &layout, const HaloCatalogue_t &catalogue, const Parameter_t &config):
Layout(layout), Catalogue(catalogue), Config(config)
{
  Grid.build(Catalogue.Halos, Config.BoxSize, Config.PeriodicBoundaryOn);
}

void SnapshotChunkTask_t::Read(const Chunk_t &chunk, ChunkAggregator_t &aggregator)
{
  ParticleStream_t stream(Layout, chunk, Config);
  Particle_t p;
  while(stream.Next(p))
	aggregator.Add(p);
  if(stream.NumberOfParticlesRead()!=chunk.size())
  {
	stringstream msg;
	msg<<"chunk "<<chunk.ChunkId<<": read "<<stream.NumberOfParticlesRead()<<" particles, expected "<<chunk.size();
	throw ReadError_t(msg.str());
  }
}

ChunkAggregator_t * SnapshotChunkTask_t::NewAggregator()
{
  return new ChunkAggregator_t(Catalogue, Grid, Config);
}

GlobalAccumulator_t::GlobalAccumulator_t(HPInt nhalos, HPInt nchunks): NumberOfChunks(nchunks), NextChunk(0), Received(nchunks, false), Halos(nhalos)
{
  for(HPInt i=0;i<nhalos;i++)
	Halos[i].Reset(i);
}

void GlobalAccumulator_t::Apply(const vector <HaloAccumulator_t> &partial)
{
  for(auto &&acc: partial)
  {
	if(acc.HaloIndex<0||acc.HaloIndex>=(HPInt)Halos.size())
	  throw runtime_error("partial result for halo index "+to_string(acc.HaloIndex)+" outside the catalogue");
	Halos[acc.HaloIndex].Merge(acc);
  }
}

bool GlobalAccumulator_t::Merge(HPInt chunk_id, vector <HaloAccumulator_t> &partial)
{
  lock_guard <mutex> lock(Mutex);
  if(chunk_id<0||chunk_id>=NumberOfChunks)
	throw runtime_error("partial result for unknown chunk "+to_string(chunk_id));
  if(Received[chunk_id])
	return false;
  Received[chunk_id]=true;
  Pending[chunk_id].swap(partial);
  for(auto it=Pending.begin();it!=Pending.end()&&it->first==NextChunk;it=Pending.erase(it))
  {
	Apply(it->second);
	NextChunk++;
  }
  return true;
}

bool GlobalAccumulator_t::IsComplete()
{
  lock_guard <mutex> lock(Mutex);
  return NextChunk==NumberOfChunks;
}

bool GlobalAccumulator_t::HasChunk(HPInt chunk_id)
{
  lock_guard <mutex> lock(Mutex);
  return Received[chunk_id];
}

HPInt GlobalAccumulator_t::NumberMerged()
{
  lock_guard <mutex> lock(Mutex);
  return NextChunk;
}

void FailureReport_t::Broadcast(MpiWorker_t &world, int root)
{
  int code=(int)Error;
  world.SyncAtom(code, MPI_INT, root);
  Error=(ErrorCode_t)code;
  world.SyncContainer(Message, MPI_CHAR, root);
  world.SyncAtom(ParticleIndex, MPI_HP_INT, root);
  world.SyncAtom(HaloId, MPI_HP_INT, root);
}

void FailureReport_t::Raise() const
{
  switch(Error)
  {
	case ErrorCode_t::None:
	  return;
	case ErrorCode_t::InconsistentAssignment:
	  throw InconsistentAssignmentError_t(ParticleIndex, HaloId);
	case ErrorCode_t::WorkerFailure:
	  throw WorkerFailure_t(Message);
	case ErrorCode_t::ReadFailure:
	  throw ReadError_t(Message);
	default:
	  throw runtime_error(Message);
  }
}

Coordinator_t::Coordinator_t(MpiWorker_t &world, const Parameter_t &config, const SnapshotLayout_t &layout, ChunkTask_t &task, GlobalAccumulator_t &global):
World(world), Config(config), Layout(layout), Task(task), Global(global), NumberOfChunks(config.NumberOfChunks),
Workers(world.size()), Attempts(config.NumberOfChunks, 0), PeakReaders(0)
{
  create_MPI_ChunkReport_type(MPI_ChunkReport_t);
  create_MPI_HaloAccumulator_type(MPI_HaloAccumulator_t);
  Summary.NumberOfChunks=NumberOfChunks;
}

Coordinator_t::~Coordinator_t()
{
  My_Type_free(&MPI_HaloAccumulator_t);
  My_Type_free(&MPI_ChunkReport_t);
}

void Coordinator_t::ProcessChunk(HPInt chunk_id, ReaderGate_t &gate, WorkerStatus_t &status, ChunkResult_t &result)
{
  result.Reset(chunk_id);
  try
  {
	unique_ptr <ChunkAggregator_t> aggregator(Task.NewAggregator());
	Chunk_t chunk=PlanChunk(Layout, NumberOfChunks, chunk_id);
	{
	  ReaderToken_t token(gate);
	  status.Transit(WorkerState_t::Reading);
	  Task.Read(chunk, *aggregator);
	}
	status.Transit(WorkerState_t::Aggregating);
	Task.Aggregate(*aggregator, result);
	status.Transit(WorkerState_t::Reporting);
	HPLog(LogLevel_t::Debug)<<"chunk "<<chunk_id<<": "<<result.Report.NumberOfParticles<<" particles, "<<result.Report.NumberOfRecords<<" halos touched"<<endl;
	return;
  }
  catch(const InconsistentAssignmentError_t &e)
  {
	result.Report.Status=(int)FailureKind_t::Fatal;
	result.Report.Error=(int)ErrorCode_t::InconsistentAssignment;
	result.Report.ParticleIndex=e.ParticleIndex;
	result.Report.HaloId=e.HaloId;
	result.Message=e.what();
  }
  catch(const ReadError_t &e)
  {
	result.Report.Status=(int)FailureKind_t::Recoverable;
	result.Report.Error=(int)ErrorCode_t::ReadFailure;
	result.Message=e.what();
  }
  catch(const WorkerFailure_t &e)
  {
	result.Report.Status=(int)FailureKind_t::Recoverable;
	result.Report.Error=(int)ErrorCode_t::WorkerFailure;
	result.Message=e.what();
  }
  catch(const exception &e)
  {
	result.Report.Status=(int)FailureKind_t::Fatal;
	result.Report.Error=(int)ErrorCode_t::Other;
	result.Message=e.what();
  }
  result.Partial.clear();
  result.Report.NumberOfRecords=0;
  status.Transit(WorkerState_t::Reporting);
  HPLog(LogLevel_t::Warning)<<"chunk "<<chunk_id<<" failed: "<<result.Message<<endl;
}

bool Coordinator_t::HandleResult(ChunkResult_t &result, bool stale, deque <HPInt> &queue)
/*returns true if the partial result has been merged.*/
{
  const ChunkReport_t &report=result.Report;
  HPInt ichunk=report.ChunkId;
  switch((FailureKind_t)report.Status)
  {
	case FailureKind_t::None:
	  if(!Global.Merge(ichunk, result.Partial))
	  {
		HPLog(LogLevel_t::Debug)<<"discarding duplicate result of chunk "<<ichunk<<endl;
		return false;
	  }
	  Summary.NumberOfParticles+=report.NumberOfParticles;
	  Summary.NumberOfSkippedParticles+=report.NumberOfSkippedParticles;
	  return true;
	case FailureKind_t::Recoverable:
	  if(stale||Global.HasChunk(ichunk))
		return false;
	  Attempts[ichunk]++;
	  if(Attempts[ichunk]>Config.MaxChunkRetries)
	  {
		if(!Failure.Failed())
		{
		  Failure.Error=ErrorCode_t::WorkerFailure;
		  Failure.Message="chunk "+to_string(ichunk)+" failed "+to_string(Attempts[ichunk])+" times, last error: "+result.Message;
		  HPLog(LogLevel_t::Error)<<Failure.Message<<endl;
		}
		return false;
	  }
	  Summary.NumberOfRetries++;
	  queue.push_back(ichunk);
	  HPLog(LogLevel_t::Warning)<<"retrying chunk "<<ichunk<<" (attempt "<<Attempts[ichunk]+1<<")"<<endl;
	  return false;
	default:
	  if(!Failure.Failed()&&!Global.HasChunk(ichunk))
	  {
		Failure.Error=(ErrorCode_t)report.Error;
		Failure.Message=result.Message;
		Failure.ParticleIndex=report.ParticleIndex;
		Failure.HaloId=report.HaloId;
		HPLog(LogLevel_t::Error)<<"chunk "<<ichunk<<": "<<Failure.Message<<endl;
	  }
	  return false;
  }
}

bool Coordinator_t::IsAnyWorkerBusy() const
{
  for(auto &&w: Workers)
	if(w.IsBusy()) return true;
  return false;
}

void Coordinator_t::Dispatch(deque <HPInt> &queue)
{
  if(Failure.Failed()) return;
  for(int rank=0;rank<World.size();rank++)
  {
	if(rank==CoordinatorRank||Workers[rank].IsBusy()) continue;
	while(!queue.empty()&&Global.HasChunk(queue.front()))
	  queue.pop_front();
	if(queue.empty()) return;
	HPInt ichunk=queue.front();
	queue.pop_front();
	MPI_Send(&ichunk, 1, MPI_HP_INT, rank, TagAssign, World.Communicator);
	Workers[rank].Assign(ichunk);
	HPLog(LogLevel_t::Debug)<<"chunk "<<ichunk<<" assigned to rank "<<rank<<endl;
  }
}

void Coordinator_t::CheckDeadlines(deque <HPInt> &queue)
/*a worker that exceeds the deadline is marked lost and its chunk is reassigned. the lost worker keeps running;
 * whichever result for the chunk arrives first is kept.*/
{
  if(Config.ChunkTimeoutSeconds<=0.||Failure.Failed()) return;
  for(int rank=0;rank<World.size();rank++)
  {
	WorkerStatus_t &w=Workers[rank];
	if(rank==CoordinatorRank||!w.IsBusy()||w.Lost) continue;
	if(w.SecondsSinceAssigned()<Config.ChunkTimeoutSeconds) continue;
	w.Lost=true;
	HPInt ichunk=w.GetChunk();
	HPLog(LogLevel_t::Warning)<<"rank "<<rank<<" missed the deadline on chunk "<<ichunk<<" ("<<WorkerStateName(w.GetState())<<")"<<endl;
	Attempts[ichunk]++;
	if(Attempts[ichunk]>Config.MaxChunkRetries)
	{
	  Failure.Error=ErrorCode_t::WorkerFailure;
	  Failure.Message="chunk "+to_string(ichunk)+" timed out after "+to_string(Attempts[ichunk])+" attempts";
	  HPLog(LogLevel_t::Error)<<Failure.Message<<endl;
	  return;
	}
	Summary.NumberOfRetries++;
	queue.push_back(ichunk);
  }
}

void Coordinator_t::RunCoordinator()
{
  ReaderTokenPool_t pool(Config.MaxRanksReading);
  deque <HPInt> queue;
  for(HPInt i=0;i<NumberOfChunks;i++)
	queue.push_back(i);
  ChunkResult_t result;
  vector <char> message;

  while(true)
  {
	Dispatch(queue);
	if(!IsAnyWorkerBusy())
	{
	  if(Global.IsComplete()||Failure.Failed())
		break;
	  throw runtime_error("all workers idle with "+to_string(NumberOfChunks-Global.NumberMerged())+" chunks outstanding");
	}

	int flag;
	MPI_Status status;
	MPI_Iprobe(MPI_ANY_SOURCE, MPI_ANY_TAG, World.Communicator, &flag, &status);
	if(!flag)
	{
	  CheckDeadlines(queue);
	  this_thread::sleep_for(chrono::milliseconds(1));
	  continue;
	}
	int src=status.MPI_SOURCE;
	WorkerStatus_t &worker=Workers[src];
	switch(status.MPI_TAG)
	{
	  case TagTokenRequest:
	  {
		int dummy;
		MPI_Recv(&dummy, 1, MPI_INT, src, TagTokenRequest, World.Communicator, MPI_STATUS_IGNORE);
		if(pool.Request(src))
		{
		  MPI_Send(&dummy, 1, MPI_INT, src, TagTokenGrant, World.Communicator);
		  worker.Transit(WorkerState_t::Reading);
		}
		break;
	  }
	  case TagTokenRelease:
	  {
		int dummy;
		MPI_Recv(&dummy, 1, MPI_INT, src, TagTokenRelease, World.Communicator, MPI_STATUS_IGNORE);
		int next=pool.Release(src);
		if(next>=0)
		{
		  MPI_Send(&dummy, 1, MPI_INT, next, TagTokenGrant, World.Communicator);
		  Workers[next].Transit(WorkerState_t::Reading);
		}
		if(worker.GetState()==WorkerState_t::Reading)
		  worker.Transit(WorkerState_t::Aggregating);
		break;
	  }
	  case TagResultHeader:
	  {
		MPI_Recv(&result.Report, 1, MPI_ChunkReport_t, src, TagResultHeader, World.Communicator, MPI_STATUS_IGNORE);
		RecvVector(World, result.Partial, MPI_HaloAccumulator_t, src, TagResultData);
		RecvVector(World, message, MPI_CHAR, src, TagResultMessage);
		result.Message.assign(message.begin(), message.end());
		if(result.Report.ChunkId!=worker.GetChunk())
		  throw runtime_error("rank "+to_string(src)+" reported chunk "+to_string(result.Report.ChunkId)+" while assigned chunk "+to_string(worker.GetChunk()));
		worker.Transit(WorkerState_t::Reporting);
		int next=pool.Release(src);//in case the worker failed while holding a token
		if(next>=0)
		{
		  int dummy=0;
		  MPI_Send(&dummy, 1, MPI_INT, next, TagTokenGrant, World.Communicator);
		  Workers[next].Transit(WorkerState_t::Reading);
		}
		HandleResult(result, worker.Lost, queue);
		worker.Transit(WorkerState_t::Idle);
		break;
	  }
	  default:
		throw runtime_error("unexpected message with tag "+to_string(status.MPI_TAG)+" from rank "+to_string(src));
	}
  }

  HPInt signal=Failure.Failed()?SpecialConst::AbortChunkId:SpecialConst::StopChunkId;
  for(int rank=0;rank<World.size();rank++)
	if(rank!=CoordinatorRank)
	  MPI_Send(&signal, 1, MPI_HP_INT, rank, TagAssign, World.Communicator);
  PeakReaders=pool.GetPeakHolders();
}

void Coordinator_t::RunWorker()
{
  MpiReaderGate_t gate(World, CoordinatorRank);
  WorkerStatus_t &status=Workers[World.rank()];
  ChunkResult_t result;
  while(true)
  {
	HPInt ichunk;
	MPI_Recv(&ichunk, 1, MPI_HP_INT, CoordinatorRank, TagAssign, World.Communicator, MPI_STATUS_IGNORE);
	if(ichunk<0)
	  break;
	status.Assign(ichunk);
	ProcessChunk(ichunk, gate, status, result);
	MPI_Send(&result.Report, 1, MPI_ChunkReport_t, CoordinatorRank, TagResultHeader, World.Communicator);
	SendVector(World, result.Partial, MPI_HaloAccumulator_t, CoordinatorRank, TagResultData);
	vector <char> message(result.Message.begin(), result.Message.end());
	SendVector(World, message, MPI_CHAR, CoordinatorRank, TagResultMessage);
	status.Transit(WorkerState_t::Idle);
  }
}

void Coordinator_t::RunLocal()
{
  ReaderTokenPool_t pool(Config.MaxRanksReading);
  LocalReaderGate_t gate(pool, World.rank());
  WorkerStatus_t &status=Workers[World.rank()];
  deque <HPInt> queue;
  for(HPInt i=0;i<NumberOfChunks;i++)
	queue.push_back(i);
  ChunkResult_t result;
  while(!queue.empty()&&!Failure.Failed())
  {
	HPInt ichunk=queue.front();
	queue.pop_front();
	if(Global.HasChunk(ichunk)) continue;
	status.Assign(ichunk);
	ProcessChunk(ichunk, gate, status, result);
	HandleResult(result, false, queue);
	status.Transit(WorkerState_t::Idle);
  }
  PeakReaders=pool.GetPeakHolders();
}

void Coordinator_t::Run()
/* collective over World. on return the global accumulator on rank 0 holds the merged sums of every chunk.
 * any failure is raised on every rank as the same exception.*/
{
  Timer_t timer;
  timer.Tick(World.Communicator);
  if(World.size()==1)
	RunLocal();
  else if(World.rank()==CoordinatorRank)
	RunCoordinator();
  else
	RunWorker();
  Failure.Broadcast(World, CoordinatorRank);
  timer.Tick(World.Communicator);
  if(Failure.Failed())
	Failure.Raise();
  HPLog.Root(LogLevel_t::Info)<<NumberOfChunks<<" chunks, "<<Summary.NumberOfParticles<<" particles processed in "<<timer.GetSeconds(1)<<" seconds ("<<Summary.NumberOfRetries<<" retries, peak "<<PeakReaders<<" concurrent readers)"<<endl;
}
