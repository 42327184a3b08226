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

#define _FILE_OFFSET_BITS 64

#include <cerrno>
#include <cstdio>
#include <new>
#include <unistd.h>
#include <sys/stat.h>
#include <zlib.h>

#include "parzip.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_index.h"
#include "decode.h"

/* Parallel restore does not stop at the first error.
   - a worker takes a permit before restoring an entry and returns it after
     the destination file has been closed or abandoned.
   - the first error found by any worker is stored in first_error.
   - every worker continues until all the entries have been distributed. */

namespace {

const char * const uftype_msg = "%s: Unknown file type 0%o, skipping.";

// prevent two threads from extracting the same file at the same time
class Name_monitor
  {
  std::vector< unsigned > crc_vector;
  std::vector< std::string > name_vector;
  pthread_mutex_t mutex;

  Name_monitor( const Name_monitor & );		// declared as private
  void operator=( const Name_monitor & );	// declared as private

public:
  explicit Name_monitor( const int num_workers )
    : crc_vector( num_workers ), name_vector( num_workers )
    { xinit_mutex( &mutex ); }

  ~Name_monitor() { xdestroy_mutex( &mutex ); }

  bool reserve_name( const unsigned worker_id, const std::string & filename )
    {
    // compare the CRCs of the names; compare the names if the CRCs collide
    unsigned crc = crc32( 0L, (const Bytef *)filename.c_str(), filename.size() );
    if( crc == 0 ) crc = 1;			// 0 means no name reserved
    xlock( &mutex );
    for( unsigned i = 0; i < crc_vector.size(); ++i )
      if( crc_vector[i] == crc && i != worker_id &&
          name_vector[i] == filename )
        { xunlock( &mutex ); return false; }	// filename already reserved
    crc_vector[worker_id] = crc; name_vector[worker_id] = filename;
    xunlock( &mutex );
    return true;
    }

  void release_name( const unsigned worker_id )
    {
    xlock( &mutex );
    crc_vector[worker_id] = 0; name_vector[worker_id].clear();
    xunlock( &mutex );
    }
  };


// Hands the file entries to the workers under a limit of concurrent restores.
class Task_courier
  {
public:
  unsigned icheck_counter;
private:
  Slot_tally permit_tally;		// limits the number of restores in flight
  const std::vector< long > & file_ids;
  unsigned long next;			// next entry to distribute
  pthread_mutex_t imutex;

  Task_courier( const Task_courier & );		// declared as private
  void operator=( const Task_courier & );	// declared as private

public:
  Task_courier( const int permits, const std::vector< long > & ids )
    : icheck_counter( 0 ), permit_tally( permits ), file_ids( ids ), next( 0 )
    { xinit_mutex( &imutex ); }

  ~Task_courier() { xdestroy_mutex( &imutex ); }

  /* Take a permit and return the index of the next entry to restore, or -1
     without a permit if all the entries have been distributed. */
  long distribute_task()
    {
    permit_tally.get_slot();			// wait for a free permit
    long id = -1;
    xlock( &imutex );
    ++icheck_counter;
    if( next < file_ids.size() ) id = file_ids[next++];
    xunlock( &imutex );
    if( id < 0 ) permit_tally.leave_slot();
    return id;
    }

  void return_permit() { permit_tally.leave_slot(); }
  bool finished() { return permit_tally.all_free() && next >= file_ids.size(); }
  };


struct Worker_arg
  {
  const Unpack_plan * plan;
  Task_courier * courier;
  Name_monitor * name_monitor;
  First_error * first_error;
  int worker_id;
  };


/* Restore one file entry. Return 0 if OK, else the exit status, with the
   kind of the error in kind and a message in estr. */
int restore_entry( const Unpack_plan & plan, const Zip_header & header,
                   Zip_entry_reader & reader, Name_monitor & name_monitor,
                   const int worker_id, Error_kind & kind, std::string & estr )
  {
  const char * const namep = header.name.c_str();
  std::string target;
  kind = ek_path_escape;
  if( gate_path( plan.dest, header.name, target, estr ) != 0 ) return 2;
  kind = ek_restore;
  if( !S_ISREG( header.mode ) )
    {
    print_error( 0, uftype_msg, namep, header.mode & S_IFMT );
    return 0;
    }
  // skip entry if another copy is already being extracted by another thread
  if( !name_monitor.reserve_name( worker_id, target ) )
    {
    if( verbosity >= 3 )
      show_file_error( namep, "Is being extracted by another thread, skipping." );
    return 0;
    }
  Dest_fs & fs = plan.fs;
  if( !fs.make_dir_path( dir_name( target ) ) )
    { format_file_error( estr, namep, intdir_msg, errno ); return 1; }
  int ret = reader.open( header );
  if( ret != 0 )
    { format_file_error( estr, namep, reader.e_msg(), reader.e_code() );
      return ret; }
  mode_t mode = header.perm();
  if( geteuid() != 0 && !plan.opts.preserve_permissions ) mode &= ~get_umask();
  const int outfd = fs.create_file( target, mode );
  if( outfd < 0 )
    { format_file_error( estr, namep, "Can't create file", errno ); return 1; }

  enum { bufsize = 32768 };
  uint8_t buf[bufsize];
  while( true )
    {
    int rd = 0;
    ret = reader.read( buf, bufsize, rd );
    if( ret != 0 )
      {
      format_file_error( estr, namep, reader.e_msg(), reader.e_code() );
      fs.close_file( outfd );
      if( !plan.opts.keep_damaged ) fs.remove_file( target );
      return ret;
      }
    if( rd == 0 ) break;			// end of entry, CRC verified
    if( writeblock( outfd, buf, rd ) != rd )
      { format_file_error( estr, namep, wr_err_msg, errno );
        fs.close_file( outfd ); return 1; }
    }
  if( fs.close_file( outfd ) != 0 )
    { format_file_error( estr, namep, eclosf_msg, errno ); return 1; }
  if( !fs.set_mtime( target, header.mtime ) && verbosity >= 2 )
    show_file_error( namep, "Can't set modification time", errno );
  if( verbosity >= 1 ) std::fprintf( stderr, "%s\n", namep );
  return 0;
  }


/* Get entries from courier and restore them. Errors are stored in
   first_error and the worker goes on with the next entry. */
extern "C" void * dworker( void * arg )
  {
  const Worker_arg & tmp = *(const Worker_arg *)arg;
  const Unpack_plan & plan = *tmp.plan;
  Task_courier & courier = *tmp.courier;
  Name_monitor & name_monitor = *tmp.name_monitor;
  First_error & first_error = *tmp.first_error;
  const int worker_id = tmp.worker_id;

  Zip_entry_reader * const reader =
    new( std::nothrow ) Zip_entry_reader( plan.infd );
  if( !reader || !reader->ok() ) { show_error( mem_msg ); exit_fail_mt(); }
  while( true )
    {
    const long id = courier.distribute_task();
    if( id < 0 ) break;			// no more entries to restore
    Error_kind kind = ek_none;
    std::string estr;
    const int ret = restore_entry( plan, plan.index.entry( id ), *reader,
                                   name_monitor, worker_id, kind, estr );
    name_monitor.release_name( worker_id );
    courier.return_permit();
    if( ret != 0 && !first_error.set( kind, ret, estr ) && verbosity >= 1 )
      std::fputs( estr.c_str(), stderr );
    }
  delete reader;
  return 0;
  }

} // end namespace


// init the courier, then start the workers and wait for all of them
void decode_mt( const Unpack_plan & plan, First_error & first_error,
                const int num_workers, const int num_permits )
  {
  Task_courier courier( num_permits, plan.file_ids );
  Name_monitor name_monitor( num_workers );

  Worker_arg * worker_args = new( std::nothrow ) Worker_arg[num_workers];
  pthread_t * worker_threads = new( std::nothrow ) pthread_t[num_workers];
  if( !worker_args || !worker_threads )
    { show_error( mem_msg ); exit_fail_mt(); }
  for( int i = 0; i < num_workers; ++i )
    {
    worker_args[i].plan = &plan;
    worker_args[i].courier = &courier;
    worker_args[i].name_monitor = &name_monitor;
    worker_args[i].first_error = &first_error;
    worker_args[i].worker_id = i;
    const int errcode =
      pthread_create( &worker_threads[i], 0, dworker, &worker_args[i] );
    if( errcode )
      { show_error( "Can't create worker threads", errcode ); exit_fail_mt(); }
    }

  for( int i = num_workers - 1; i >= 0; --i )
    {
    const int errcode = pthread_join( worker_threads[i], 0 );
    if( errcode )
      { show_error( "Can't join worker threads", errcode ); exit_fail_mt(); }
    }
  delete[] worker_threads;
  delete[] worker_args;

  if( plan.opts.debug_level & 1 )
    std::fprintf( stderr,
      "any worker tried to take a permit        %8u times\n",
      courier.icheck_counter );

  if( !courier.finished() ) internal_error( conofin_msg );
  }
