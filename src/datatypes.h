#ifndef DATATYPES_INCLUDED

#include <iostream>
#include <iterator>
#include <cstring>
using namespace std;
#include <array>

/*datatype for internal calculation and output*/
#ifdef HP_REAL8
typedef double HPReal;
#define MPI_HP_REAL MPI_DOUBLE
#else
typedef float HPReal;
#define MPI_HP_REAL MPI_FLOAT
#endif

// HPInt has to hold the global particle index, which easily exceeds 2^31 for production runs
#ifdef HP_INT8
typedef long HPInt;
#define MPI_HP_INT MPI_LONG
#else
typedef int HPInt;
#define MPI_HP_INT MPI_INT
#endif

typedef array <HPReal, 3> HPxyz;

namespace SpecialConst
{
  const HPInt NullHaloId=-1;//do not change this. membership files mark unbound particles with it.
  const HPInt NullChunkId=-1;
};

/*particle species, in the order of the PartTypeN groups of the snapshot*/
enum ParticleType_t:int
{
  TypeGas=0,
  TypeDM,
  TypeDMBackground,
  TypeSink,
  TypeStar,
  TypeBH,
  TypeNeutrino,
  TypeMax
};

struct LocatedHalo_t
/*a halo found within search range of a particle*/
{
  HPInt index;
  HPReal d2; //distance**2
  LocatedHalo_t(){};
  LocatedHalo_t(HPInt index, HPReal d2):index(index),d2(d2)
  {}
};

#define DATATYPES_INCLUDED
#endif
