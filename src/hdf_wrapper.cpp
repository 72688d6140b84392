#include "hdf_wrapper.h"
#include "mymath.h"
#include <cstring>

string GetObjectPath(hid_t loc)
{
  const int bufsize=1024;
  char grpname[bufsize],filename[bufsize];
  if(H5Iget_name(loc, grpname, bufsize)<0) grpname[0]='\0';
  if(H5Fget_name(loc, filename, bufsize)<0) filename[0]='\0';
  return string(filename)+":"+grpname;
}

void writeHDFmatrix(hid_t file, const void * buf, const char * name, hsize_t ndim, const hsize_t *dims, hid_t dtype, hid_t dtype_file)
{
  hid_t dataspace = H5Screate_simple (ndim, dims, NULL);
  hid_t dataset= H5Dcreate2(file, name, dtype_file, dataspace, H5P_DEFAULT, H5P_DEFAULT,
                H5P_DEFAULT);
  if(dataset<0)
  {
	H5Sclose(dataspace);
	throw WriteError_t("cannot create dataset "+GetObjectPath(file)+"/"+name);
  }
  herr_t status=0;
  if(!(NULL==buf||0==dims[0]))
	status = H5Dwrite (dataset, dtype, H5S_ALL, H5S_ALL, H5P_DEFAULT, buf);
  H5Dclose(dataset);
  H5Sclose(dataspace);
  if(status<0)
	throw WriteError_t("failed writing "+GetObjectPath(file)+"/"+name);
}

herr_t SetStringAttribute(hid_t loc_id, const char *obj_name, const char *attr_name, const char *content)
/* set string attribute named attr_name to object obj_name at loc_id.
 * if loc_id fully specifies the object, obj_name="."
 * content specifies the attribute content
 *
 * equivalent to H5LTset_attribute_string() function in H5LT
 */
{
     hid_t dataspace  = H5Screate(H5S_SCALAR);
     hid_t attr_type = H5Tcopy(H5T_C_S1);
     H5Tset_size(attr_type, strlen(content)+1);
     H5Tset_strpad(attr_type, H5T_STR_NULLTERM);
     hid_t attr = H5Acreate_by_name(loc_id, obj_name, attr_name, attr_type, dataspace, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
     herr_t status = H5Awrite(attr, attr_type, content);

     H5Sclose(dataspace);
     H5Tclose(attr_type);
     H5Aclose(attr);

  return status;
}

void WriteAttribute(hid_t loc_id, const char *obj_name, const char *attr_name, hid_t dtype, hsize_t n, const void *buf)
{
  hid_t dataspace=H5Screate_simple(1, &n, NULL);
  hid_t attr=H5Acreate_by_name(loc_id, obj_name, attr_name, dtype, dataspace, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  herr_t status=-1;
  if(attr>=0)
  {
	status=H5Awrite(attr, dtype, buf);
	H5Aclose(attr);
  }
  H5Sclose(dataspace);
  if(status<0)
	throw WriteError_t("failed writing attribute "+string(obj_name)+"/"+attr_name+" in "+GetObjectPath(loc_id));
}

hid_t OpenFileForRead(const string &filename)
{
  if(!file_exist(filename))
	throw ReadError_t("file "+filename+" does not exist");
  hid_t file=H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  if(file<0)
	throw ReadError_t("failed to open "+filename);
  return file;
}

hsize_t GetDatasetLength(hid_t loc, const char *name)
{
  hid_t dset=H5Dopen2(loc, name, H5P_DEFAULT);
  if(dset<0)
	throw ReadError_t("cannot open dataset "+GetObjectPath(loc)+"/"+name);
  hsize_t dims[H5S_MAX_RANK];
  int ndim=GetDatasetDims(dset, dims);
  H5Dclose(dset);
  if(ndim<1) return 1;//scalar
  return dims[0];
}

void ReadPartialDataset(hid_t loc, const char *name, hid_t dtype, hsize_t offset, hsize_t count, void *buf)
/* read rows [offset, offset+count) of a 1d or 2d dataset; the second dimension, if any, is read in full.*/
{
  if(0==count) return;
  hid_t dset=H5Dopen2(loc, name, H5P_DEFAULT);
  if(dset<0)
	throw ReadError_t("cannot open dataset "+GetObjectPath(loc)+"/"+name);
  hid_t filespace=H5Dget_space(dset);
  hsize_t dims[2];
  int ndim=H5Sget_simple_extent_ndims(filespace);
  if(ndim<1||ndim>2)
  {
	H5Sclose(filespace);
	H5Dclose(dset);
	throw ReadError_t("unexpected rank of dataset "+GetObjectPath(loc)+"/"+name);
  }
  H5Sget_simple_extent_dims(filespace, dims, NULL);
  if(offset+count>dims[0])
  {
	H5Sclose(filespace);
	H5Dclose(dset);
	throw ReadError_t("rows requested beyond the end of "+GetObjectPath(loc)+"/"+name);
  }
  hsize_t start[2]={offset, 0}, block[2]={count, ndim>1?dims[1]:1};
  H5Sselect_hyperslab(filespace, H5S_SELECT_SET, start, NULL, block, NULL);
  hid_t memspace=H5Screate_simple(ndim, block, NULL);
  herr_t status=H5Dread(dset, dtype, memspace, filespace, H5P_DEFAULT, buf);
  H5Sclose(memspace);
  H5Sclose(filespace);
  H5Dclose(dset);
  if(status<0)
	throw ReadError_t("failed reading rows of "+GetObjectPath(loc)+"/"+name);
}
