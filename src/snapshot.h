#ifndef SNAPSHOT_H_INCLUDED
#define SNAPSHOT_H_INCLUDED

#include <iostream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <vector>

#include "datatypes.h"
#include "mymath.h"
#include "config_parser.h"
#include "mpi_wrapper.h"
#include "hdf_wrapper.h"

struct Particle_t
{
  HPInt Index;//global index in the native ordering of the snapshot
  HPInt Id;
  HPxyz ComovingPosition;
  HPxyz Velocity;
  HPReal Mass;
  HPReal Temperature;//gas only; 0 when not available
  double XrayLuminosity;//gas only; 0 when not available
  double XrayPhotonLuminosity;//gas only; 0 when not available
  double ComptonY;//gas only; 0 when not available
  HPReal InitialMass;//stars only; 0 when not available
  HPReal SubgridMass;//black holes only; 0 when not available
  ParticleType_t Type;
  HPInt HostHaloId;//halo id from the membership files; NullHaloId if none, or if there are no membership files
  Particle_t(){};//do nothing. this leaves the content uninitialized, for fast memory allocation.
};

struct Cosmology_t
{
  double OmegaM0;
  double OmegaLambda0;
  double HubbleParam;
  double ScaleFactor;

  //derived parameters:
  double Hz; //current Hubble param in internal units
  double CriticalDensity;//comoving critical density at ScaleFactor, internal units
  double MeanDensity;//comoving mean matter density, internal units

  void Set(double scalefactor, double omega0, double omegaLambda0, double h);
};

struct SnapshotHeader_t
{
  int      NumberOfFiles;
  double   BoxSize;
  double   ScaleFactor;
  double   OmegaM0;
  double   OmegaLambda0;
  double   HubbleParam;
  HPInt    NumPartTotal[TypeMax];
};
extern void create_SnapshotHeader_MPI_type(MPI_Datatype &dtype);

/*a contiguous run of particles of one type in one snapshot file*/
struct FileSlice_t
{
  int File;
  int Type;
  HPInt Offset;//first row inside the PartTypeN group of the file
  HPInt Count;
  HPInt GlobalBegin;//global index of the first particle of the slice
};

class SnapshotLayout_t
/* particle counts of every (file, type) block, and where each block starts in the native ordering:
 * file by file, and type by type inside each file.*/
{
  vector <HPInt> NumPartFileType;//[ifile*TypeMax+itype]
  vector <HPInt> OffsetFileType;
  void ReadFiles(const Parameter_t &config);
public:
  SnapshotHeader_t Header;
  HPInt NumberOfParticles;

  SnapshotLayout_t(): NumberOfParticles(0)
  {
  }
  void Load(MpiWorker_t &world, const Parameter_t &config, int root=0);
  void CompileOffsets();
  int GetNumberOfFiles() const
  {
	return Header.NumberOfFiles;
  }
  HPInt GetCount(int ifile, int itype) const
  {
	return NumPartFileType[ifile*TypeMax+itype];
  }
  HPInt GetOffset(int ifile, int itype) const
  {
	return OffsetFileType[ifile*TypeMax+itype];
  }
  void SetCounts(int nfiles, const vector <HPInt> &counts);
};

struct Chunk_t;

class ParticleStream_t
/* lazy, single-pass reader over the particles of one chunk.
 * the slices of the chunk are read one block at a time with hyperslab selections, and the particles are handed out
 * one by one in the native order. At most one snapshot file and one membership file are open at any time.
 * once exhausted the stream stays exhausted; there is no way to rewind it.*/
{
  const SnapshotLayout_t &Layout;
  const Parameter_t &Config;
  vector <FileSlice_t> Slices;
  size_t iSlice;
  HPInt SliceRowsDone;
  vector <Particle_t> Buffer;
  size_t BufferPos;
  int CurrentFile;
  hid_t SnapshotFile, MembershipFile;
  HPInt NumberRead;
  bool Exhausted;

  void OpenFile(int ifile);
  void CloseFiles();
  bool FillBuffer();
  void ReadBlock(const FileSlice_t &slice, HPInt offset, HPInt count);
public:
  static const HPInt BlockSize=1<<20;
  ParticleStream_t(const SnapshotLayout_t &layout, const Chunk_t &chunk, const Parameter_t &config);
  ~ParticleStream_t()
  {
	CloseFiles();
  }
  ParticleStream_t(const ParticleStream_t &)=delete;
  ParticleStream_t & operator=(const ParticleStream_t &)=delete;
  bool Next(Particle_t &p);
  HPInt NumberOfParticlesRead() const
  {
	return NumberRead;
  }
  bool IsExhausted() const
  {
	return Exhausted;
  }
};

extern const char *PartTypeGroupName(int itype);
extern const char *MassDatasetName(int itype);

#endif
