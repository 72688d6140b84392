#ifndef HDF_WRAPPER_INCLUDED
#define HDF_WRAPPER_INCLUDED

#include "hdf5.h"
#include "hdf5_hl.h"
#include <iostream>
#include <string>

#include "datatypes.h"
#include "errors.h"

#ifdef HP_REAL8
#define H5T_HPReal H5T_NATIVE_DOUBLE
#else
#define H5T_HPReal H5T_NATIVE_FLOAT
#endif
#ifdef HP_INT8
#define H5T_HPInt H5T_NATIVE_LONG
#else
#define H5T_HPInt H5T_NATIVE_INT
#endif

class HDFHandle_t
/*an open file, group or dataset id, closed when the handle goes out of scope. negative ids are not closed.*/
{
  hid_t Id;
  herr_t (*Closer)(hid_t);
public:
  HDFHandle_t(hid_t id, herr_t (*closer)(hid_t)): Id(id), Closer(closer)
  {
  }
  ~HDFHandle_t()
  {
	if(Id>=0) Closer(Id);
  }
  HDFHandle_t(const HDFHandle_t &)=delete;
  HDFHandle_t & operator=(const HDFHandle_t &)=delete;
  operator hid_t() const
  {
	return Id;
  }
};

extern void writeHDFmatrix(hid_t file, const void * buf, const char * name, hsize_t ndim, const hsize_t *dims, hid_t dtype, hid_t dtype_file);
extern herr_t SetStringAttribute(hid_t loc_id, const char *obj_name, const char *attr_name, const char *content);
extern void WriteAttribute(hid_t loc_id, const char *obj_name, const char *attr_name, hid_t dtype, hsize_t n, const void *buf);
extern hid_t OpenFileForRead(const string &filename);
extern void ReadPartialDataset(hid_t loc, const char *name, hid_t dtype, hsize_t offset, hsize_t count, void *buf);
extern hsize_t GetDatasetLength(hid_t loc, const char *name);
extern string GetObjectPath(hid_t loc);

inline int GetDatasetDims(hid_t dset, hsize_t dims[])
{
  hid_t dspace=H5Dget_space(dset);
  int ndim=H5Sget_simple_extent_dims(dspace, dims, NULL);
  H5Sclose(dspace);
  return ndim;
}
inline bool DatasetExists(hid_t loc, const char *name)
{
  return H5Lexists(loc, name, H5P_DEFAULT)>0;
}
inline void ReadDataset(hid_t file, const char *name, hid_t dtype, void *buf)
/* read named dataset from file into buf.
 * dtype specifies the datatype of buf; it does not need to be the same as the storage type in file*/
{
  hid_t dset=H5Dopen2(file, name, H5P_DEFAULT);
  if(dset<0)
	throw ReadError_t("cannot open dataset "+GetObjectPath(file)+"/"+name);
  herr_t status=H5Dread(dset, dtype, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf);
  H5Dclose(dset);
  if(status<0)
	throw ReadError_t("failed reading "+GetObjectPath(file)+"/"+name);
}
inline void ReadAttribute(hid_t loc_id, const char *obj_name, const char *attr_name, hid_t dtype, void *buf)
/* read named attribute of object into buf. if loc_id fully specifies the object, obj_name="."
 * dtype specifies the datatype of buf; it does not need to be the same as the storage type in file*/
{
  hid_t attr=H5Aopen_by_name(loc_id, obj_name, attr_name, H5P_DEFAULT, H5P_DEFAULT);
  if(attr<0)
	throw ReadError_t("cannot open attribute "+string(obj_name)+"/"+attr_name+" in "+GetObjectPath(loc_id));
  herr_t status=H5Aread(attr, dtype, buf);
  H5Aclose(attr);
  if(status<0)
	throw ReadError_t("failed reading attribute "+string(obj_name)+"/"+attr_name+" in "+GetObjectPath(loc_id));
}
inline void writeHDFmatrix(hid_t file, const void * buf, const char * name, hsize_t ndim, const hsize_t *dims, hid_t dtype)
{
  writeHDFmatrix(file, buf, name, ndim, dims, dtype, dtype);
}
#endif
