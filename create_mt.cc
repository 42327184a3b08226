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

#include <cstdio>
#include <map>
#include <new>
#include <queue>
#include <sys/stat.h>

#include "parzip.h"
#include "common_mutex.h"
#include "zip_format.h"
#include "zip_writer.h"
#include "create.h"


namespace {

/* Hands the sequence numbers of the paths to the workers in walk order,
   and moves the prepared entries from the workers to the muxer.
   A slot is taken by a worker before claiming a path and is returned by
   the muxer after committing or discarding the entry, so at most
   'slots' entries are being prepared or waiting to be committed. */
class Packet_courier			// moves packets around
  {
public:
  unsigned icheck_counter;
  unsigned ocheck_counter;
  unsigned owait_counter;
private:
  Slot_tally slot_tally;		// limits the number of entries in flight
  std::queue< Prepared_entry * > packet_queue;
  const long num_paths;
  long next_seq;			// next path to distribute
  int num_working;			// number of workers still running
  pthread_mutex_t imutex;
  pthread_mutex_t omutex;
  pthread_cond_t oav_or_exit;	// output packet available or all workers exited
  bool aborted;				// distribute no more paths

  Packet_courier( const Packet_courier & );	// declared as private
  void operator=( const Packet_courier & );	// declared as private

public:
  Packet_courier( const int workers, const int slots, const long paths )
    : icheck_counter( 0 ), ocheck_counter( 0 ), owait_counter( 0 ),
      slot_tally( slots ), num_paths( paths ), next_seq( 0 ),
      num_working( workers ), aborted( false )
    {
    xinit_mutex( &imutex );
    xinit_mutex( &omutex ); xinit_cond( &oav_or_exit );
    }

  ~Packet_courier()
    {
    xdestroy_cond( &oav_or_exit ); xdestroy_mutex( &omutex );
    xdestroy_mutex( &imutex );
    }

  /* Return the sequence number of the next path to prepare, or -1 if all
     the paths have been distributed or the operation has been aborted. */
  long distribute_seq()
    {
    slot_tally.get_slot();			// wait for a free slot
    long seq = -1;
    xlock( &imutex );
    ++icheck_counter;
    if( !aborted && next_seq < num_paths ) seq = next_seq++;
    xunlock( &imutex );
    if( seq < 0 )
      {
      slot_tally.leave_slot();
      // notify muxer when last worker exits
      xlock( &omutex );
      if( --num_working == 0 ) xsignal( &oav_or_exit );
      xunlock( &omutex );
      }
    return seq;
    }

  // collect a prepared entry from a worker
  void collect_packet( Prepared_entry * const entry )
    {
    xlock( &omutex );
    packet_queue.push( entry );
    xsignal( &oav_or_exit );
    xunlock( &omutex );
    }

  /* Deliver to muxer the entries collected so far, in arrival order.
     Return an empty vector once all workers have exited. */
  void deliver_packets( std::vector< Prepared_entry * > & packet_vector )
    {
    packet_vector.clear();
    xlock( &omutex );
    ++ocheck_counter;
    while( packet_queue.empty() && num_working > 0 )
      { ++owait_counter; xwait( &oav_or_exit, &omutex ); }
    while( !packet_queue.empty() )
      { packet_vector.push_back( packet_queue.front() ); packet_queue.pop(); }
    xunlock( &omutex );
    }

  void leave_slot() { slot_tally.leave_slot(); }	// entry committed

  void abort()			// workers finish their current entry and exit
    {
    xlock( &imutex );
    aborted = true;
    xunlock( &imutex );
    }

  bool finished()		// all packets delivered to muxer
    {
    if( !slot_tally.all_free() || num_working != 0 ) return false;
    if( !aborted && next_seq != num_paths ) return false;
    return packet_queue.empty();
    }
  };


struct Worker_arg
  {
  const Pack_plan * plan;
  Packet_courier * courier;
  Prepare_fn prepare;
  };


/* Get sequence numbers from courier, prepare the corresponding paths, and
   give the prepared entries to courier.
*/
extern "C" void * pworker( void * arg )
  {
  const Worker_arg & tmp = *(const Worker_arg *)arg;
  const Pack_plan & plan = *tmp.plan;
  Packet_courier & courier = *tmp.courier;
  const Prepare_fn prepare = tmp.prepare;

  while( true )
    {
    const long seq = courier.distribute_seq();
    if( seq < 0 ) break;		// no more paths to prepare
    Prepared_entry * const entry = new( std::nothrow ) Prepared_entry( seq );
    if( !entry ) { show_error( mem_msg ); exit_fail_mt(); }
    prepare( plan, seq, *entry );
    courier.collect_packet( entry );
    }
  return 0;
  }


// Write one entry to the archive. Return false if the pack must stop.
bool commit_entry( const Prepared_entry & entry, Zip_writer & writer,
                   Op_error & error )
  {
  if( entry.retval != 0 )
    { error.set( ek_prepare, entry.retval, entry.estr ); return false; }
  if( entry.estr.size() && verbosity >= 0 )	// diagnostic
    std::fputs( entry.estr.c_str(), stderr );
  if( !entry.write ) return true;
  std::string estr;
  if( writer.write_entry( entry.header, entry.content, estr ) != 0 )
    { error.set( writer.write_error() ? ek_write : ek_prepare, 1, estr );
      return false; }
  if( verbosity >= 1 )
    std::fprintf( stderr, "%s\n", entry.header.name.c_str() );
  return true;
  }


/* Get from courier the prepared entries in any order, hold the early ones,
   and write them to the archive in sequence order. The first error in
   sequence order stops the pack.
*/
Op_error muxer( Packet_courier & courier, Zip_writer & writer,
                const long num_paths )
  {
  Op_error error;
  std::map< long, Prepared_entry * > holding;	// entries arrived early
  std::vector< Prepared_entry * > packet_vector;
  long next = 0;			// sequence number to commit next
  while( true )
    {
    courier.deliver_packets( packet_vector );
    if( packet_vector.empty() ) break;	// queue is empty. all workers exited

    for( unsigned i = 0; i < packet_vector.size(); ++i )
      {
      Prepared_entry * const entry = packet_vector[i];
      if( !error.ok() ) { delete entry; courier.leave_slot(); continue; }
      if( entry->seq < next || !holding.insert(
          std::make_pair( entry->seq, entry ) ).second )
        internal_error( "duplicate sequence number in muxer." );
      }
    while( error.ok() )
      {
      const std::map< long, Prepared_entry * >::iterator it =
        holding.find( next );
      if( it == holding.end() ) break;
      Prepared_entry * const entry = it->second;
      holding.erase( it );
      const bool ok = commit_entry( *entry, writer, error );
      delete entry; courier.leave_slot(); ++next;
      if( !ok )
        {
        courier.abort();
        std::map< long, Prepared_entry * >::iterator jt = holding.begin();
        for( ; jt != holding.end(); ++jt )
          { delete jt->second; courier.leave_slot(); }
        holding.clear();
        }
      }
    }
  if( error.ok() && ( next != num_paths || !holding.empty() ) )
    internal_error( "muxer finished with entries not committed." );
  return error;
  }

} // end namespace


// init the courier, then start the workers and call the muxer
Op_error encode_mt( const Pack_plan & plan, Zip_writer & writer,
                    const Prepare_fn prepare, const int num_workers,
                    const int out_slots, const int debug_level )
  {
  /* If an error happens after any threads have been started, exit must be
     called before courier goes out of scope. */
  Packet_courier courier( num_workers, out_slots, plan.paths.size() );

  Worker_arg * worker_args = new( std::nothrow ) Worker_arg[num_workers];
  pthread_t * worker_threads = new( std::nothrow ) pthread_t[num_workers];
  if( !worker_args || !worker_threads )
    { show_error( mem_msg ); exit_fail_mt(); }
  for( int i = 0; i < num_workers; ++i )
    {
    worker_args[i].plan = &plan;
    worker_args[i].courier = &courier;
    worker_args[i].prepare = prepare;
    const int errcode =
      pthread_create( &worker_threads[i], 0, pworker, &worker_args[i] );
    if( errcode )
      { show_error( "Can't create worker threads", errcode ); exit_fail_mt(); }
    }

  const Op_error error = muxer( courier, writer, plan.paths.size() );

  for( int i = num_workers - 1; i >= 0; --i )
    {
    const int errcode = pthread_join( worker_threads[i], 0 );
    if( errcode )
      { show_error( "Can't join worker threads", errcode ); exit_fail_mt(); }
    }
  delete[] worker_threads;
  delete[] worker_args;

  if( debug_level & 1 )
    std::fprintf( stderr,
      "any worker tried to claim a path         %8u times\n"
      "muxer tried to consume from workers      %8u times\n"
      "muxer had to wait                        %8u times\n",
      courier.icheck_counter,
      courier.ocheck_counter,
      courier.owait_counter );

  if( !courier.finished() ) internal_error( conofin_msg );
  return error;
  }
