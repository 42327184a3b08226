/* Parzip - Parallel zip archiver
   Copyright (C) 2026 The parzip developers.

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 2 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

/* File-system operations used to restore entries. The default versions
   act on the real file system. */
class Dest_fs
  {
public:
  virtual ~Dest_fs() {}

  // create dirname and its missing parents
  virtual bool make_dir_path( const std::string & dirname );
  /* Create or truncate filename with the permission bits in mode.
     Return the file descriptor, or -1 with errno set. */
  virtual int create_file( const std::string & filename, const mode_t mode );
  virtual int close_file( const int fd );
  virtual bool remove_file( const std::string & filename );
  virtual bool set_mtime( const std::string & filename, const long long mtime );
  };


struct Unpack_options
  {
  std::string archive;			// name of the zip file to read
  std::string dest;			// destination directory
  int num_workers;			// 0 = number of online processors
  int num_permits;			// 0 = number of online processors
  int debug_level;
  bool preserve_permissions;		// don't subtract the umask
  bool keep_damaged;			// keep partial files after data errors
  Dest_fs * dest_fs;			// 0 = real file system

  Unpack_options()
    : num_workers( 0 ), num_permits( 0 ), debug_level( 0 ),
      preserve_permissions( false ),
      keep_damaged( false ), dest_fs( 0 ) {}
  };


// Set of file entries shared by the restore workers. Read-only.
struct Unpack_plan
  {
  const Unpack_options & opts;
  const Zip_index & index;
  const int infd;
  std::string dest;			// cleaned destination directory
  std::vector< long > file_ids;		// indexes of the non-directory entries
  Dest_fs & fs;

  Unpack_plan( const Unpack_options & o, const Zip_index & i, const int fd,
               Dest_fs & f )
    : opts( o ), index( i ), infd( fd ), fs( f ) {}
  };

// defined in decode.cc
bool format_entry_name( const Zip_header & header, Resizable_buffer & rbuf,
                        const bool long_format );
int list_archive( const std::string & archive_name );
Op_error unpack_archive( const Unpack_options & opts );

// defined in decode_mt.cc
void decode_mt( const Unpack_plan & plan, First_error & first_error,
                const int num_workers, const int num_permits );
