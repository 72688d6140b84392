#include "mpi_wrapper.h"

void MpiWorker_t::SyncAtomBool(bool& x, int root)
{
  char y;
  if(rank()==root)
	y=x;
  MPI_Bcast(&y, 1, MPI_CHAR, root, Communicator);
  x=y;
}
void MpiWorker_t::SyncVectorBool(vector< bool >& x, int root)
{
  vector <char> y;
  if(rank()==root)
	y.assign(x.begin(),x.end());
  SyncContainer(y, MPI_CHAR, root);
  if(rank()!=root)
	x.assign(y.begin(),y.end());
}

bool MpiWorker_t::SyncFailure(bool failed, string &message, int root)
/*broadcast the failure state of root, together with its message if it failed*/
{
  SyncAtomBool(failed, root);
  if(failed)
	SyncContainer(message, MPI_CHAR, root);
  return failed;
}

bool MpiWorker_t::AnyFailed(bool failed)
/*collective. true on every rank if any rank failed.*/
{
  int flag=failed;
  MPI_Allreduce(MPI_IN_PLACE, &flag, 1, MPI_INT, MPI_LOR, Communicator);
  return flag;
}

void My_Type_free(MPI_Datatype *datatype) {

  int finalized;
  MPI_Finalized(&finalized);
  if(!finalized)MPI_Type_free(datatype);

}
