#ifndef HP_MPI_WRAPPER_H
#define HP_MPI_WRAPPER_H

#include <mpi.h>
#include <string>
#include <vector>
#include <stdexcept>
#include <climits>
#include <numeric>

#include "datatypes.h"
#include "mymath.h"

class MpiWorker_t
{
public:
  int  NumberOfWorkers, WorkerId, NameLen;
  char HostName[MPI_MAX_PROCESSOR_NAME];
  MPI_Comm Communicator; //do not use reference
  MpiWorker_t(MPI_Comm comm): Communicator(comm)
  {
	MPI_Comm_size(comm,&NumberOfWorkers);
	MPI_Comm_rank(comm,&WorkerId);
	MPI_Get_processor_name(HostName, &NameLen);
  }
  int size() const
  {
	return NumberOfWorkers;
  }
  int rank() const
  {
	return WorkerId;
  }
  template <class T>
  void SyncContainer(T &x, MPI_Datatype dtype, int root_worker);
  template <class T>
  void SyncAtom(T &x, MPI_Datatype dtype, int root_worker);
  void SyncAtomBool(bool &x, int root);
  void SyncVectorBool(vector <bool>&x, int root);
  bool SyncFailure(bool failed, string &message, int root);
  bool AnyFailed(bool failed);
};

template <class T>
void MpiWorker_t::SyncContainer(T &x, MPI_Datatype dtype, int root_worker)
{
  int len;

  if(root_worker==WorkerId)
  {
	if(x.size()>=INT_MAX)
	throw runtime_error("Error: in SyncContainer(), sending more than INT_MAX elements with MPI causes overflow.\n");
	len=x.size();
  }
  MPI_Bcast(&len, 1, MPI_INT, root_worker, Communicator);

  if(root_worker!=WorkerId)
	x.resize(len);
  MPI_Bcast((void *)x.data(), len, dtype, root_worker, Communicator);
};
template <class T>
inline void MpiWorker_t::SyncAtom(T& x, MPI_Datatype dtype, int root_worker)
{
  MPI_Bcast(&x, 1, dtype, root_worker, Communicator);
}

template <class T>
void VectorAllGather(MpiWorker_t &world, const vector <T> &LocalVec, vector <T> &AllVec, MPI_Datatype dtype)
/*concatenate LocalVec from every rank, in rank order, into AllVec on every rank*/
{
  if(LocalVec.size()>=INT_MAX)
	throw runtime_error("Error: in VectorAllGather(), sending more than INT_MAX elements with MPI causes overflow.\n");
  int nlocal=LocalVec.size();
  vector <int> Counts(world.size()), Disps(world.size());
  MPI_Allgather(&nlocal, 1, MPI_INT, Counts.data(), 1, MPI_INT, world.Communicator);
  size_t ntot=CompileOffsets(Counts, Disps);
  if(ntot>=INT_MAX)
	throw runtime_error("Error: in VectorAllGather(), gathering more than INT_MAX elements with MPI causes overflow.\n");
  AllVec.resize(ntot);
  MPI_Allgatherv(LocalVec.data(), nlocal, dtype, AllVec.data(), Counts.data(), Disps.data(), dtype, world.Communicator);
}

template <class T>
void SendVector(MpiWorker_t &world, const vector <T> &x, MPI_Datatype dtype, int dest, int tag)
{
  if(x.size()>=INT_MAX)
	throw runtime_error("Error: in SendVector(), sending more than INT_MAX elements with MPI causes overflow.\n");
  MPI_Send(x.data(), x.size(), dtype, dest, tag, world.Communicator);
}

template <class T>
void RecvVector(MpiWorker_t &world, vector <T> &x, MPI_Datatype dtype, int source, int tag)
/*receive a message of unknown length; the length is probed before receiving.*/
{
  MPI_Status status;
  MPI_Probe(source, tag, world.Communicator, &status);
  int len;
  MPI_Get_count(&status, dtype, &len);
  x.resize(len);
  MPI_Recv(x.data(), len, dtype, status.MPI_SOURCE, tag, world.Communicator, MPI_STATUS_IGNORE);
}

/*
   Free an MPI type, but only if MPI has not been finalized.
   This is for use in object destructors which might be called
   after MPI has been finalized. If it has, the type has already
   been freed and we don't need to do anything.
*/
void My_Type_free(MPI_Datatype *datatype);
#endif
