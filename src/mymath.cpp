#include <iostream>
#include <stdexcept>

#include "mymath.h"

void AssignTasks(HPInt worker_id, HPInt nworkers, HPInt ntasks, HPInt &task_begin, HPInt &task_end)
/*split ntasks into nworkers contiguous ranges whose sizes differ by at most one, the leading workers taking the
 * larger ones. the range of worker_id is returned as [task_begin, task_end).*/
{
  if(nworkers<=0||worker_id<0||worker_id>=nworkers)
	throw invalid_argument("worker "+to_string(worker_id)+" out of "+to_string(nworkers)+" workers");
  HPInt ntask_remainder=ntasks%nworkers;
  HPInt ntask_this=ntasks/nworkers;
  task_begin=ntask_this*worker_id+min(ntask_remainder, worker_id);
  if(worker_id<ntask_remainder)
	ntask_this++;
  task_end=ntask_this+task_begin;
}
