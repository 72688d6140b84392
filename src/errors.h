/* Exceptions raised by the halo property pipeline.
 *
 * Fatal errors (configuration, catalogue, write) stop the whole job before or instead of producing output.
 * ReadError_t and WorkerFailure_t occurring inside a chunk are recoverable: the coordinator reassigns the chunk,
 * up to MaxChunkRetries times, before escalating to a fatal WorkerFailure_t.
 */
#ifndef ERRORS_H_INCLUDED
#define ERRORS_H_INCLUDED

#include <stdexcept>
#include <string>
#include <sstream>

#include "datatypes.h"

class ConfigurationError_t: public runtime_error
{
public:
  explicit ConfigurationError_t(const string &msg): runtime_error("ConfigurationError: "+msg)
  {}
};

class MissingCatalogueError_t: public runtime_error
{
public:
  explicit MissingCatalogueError_t(const string &filename): runtime_error("MissingCatalogueError: failed to open halo catalogue "+filename)
  {}
};

class InconsistentAssignmentError_t: public runtime_error
{
  static string Format(HPInt particle_index, HPInt halo_id)
  {
	stringstream msg;
	msg<<"InconsistentAssignmentError: particle "<<particle_index<<" claims membership of halo "<<halo_id<<", which is not in the catalogue";
	return msg.str();
  }
public:
  HPInt ParticleIndex;
  HPInt HaloId;
  InconsistentAssignmentError_t(HPInt particle_index, HPInt halo_id): runtime_error(Format(particle_index, halo_id)), ParticleIndex(particle_index), HaloId(halo_id)
  {}
};

class ReadError_t: public runtime_error
{
public:
  explicit ReadError_t(const string &msg): runtime_error("ReadError: "+msg)
  {}
};

class WorkerFailure_t: public runtime_error
{
public:
  explicit WorkerFailure_t(const string &msg): runtime_error("WorkerFailure: "+msg)
  {}
};

class WriteError_t: public runtime_error
{
public:
  explicit WriteError_t(const string &msg): runtime_error("WriteError: "+msg)
  {}
};

#endif
