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

#include <pthread.h>

void xinit_mutex( pthread_mutex_t * const mutex );
void xinit_cond( pthread_cond_t * const cond );
void xdestroy_mutex( pthread_mutex_t * const mutex );
void xdestroy_cond( pthread_cond_t * const cond );
void xlock( pthread_mutex_t * const mutex );
void xunlock( pthread_mutex_t * const mutex );
void xwait( pthread_cond_t * const cond, pthread_mutex_t * const mutex );
void xsignal( pthread_cond_t * const cond );

// non-pthread_* declarations are in parzip.h


// Counting semaphore. Limits the number of concurrent holders to 'slots'.
class Slot_tally
  {
  const int num_slots;				// total slots
  int num_free;					// remaining free slots
  pthread_mutex_t mutex;
  pthread_cond_t slot_av;			// slot available

  Slot_tally( const Slot_tally & );		// declared as private
  void operator=( const Slot_tally & );		// declared as private

public:
  explicit Slot_tally( const int slots )
    : num_slots( slots ), num_free( slots )
    { xinit_mutex( &mutex ); xinit_cond( &slot_av ); }

  ~Slot_tally() { xdestroy_cond( &slot_av ); xdestroy_mutex( &mutex ); }

  bool all_free()
    { xlock( &mutex ); const bool b = num_free == num_slots;
      xunlock( &mutex ); return b; }

  void get_slot()				// wait for a free slot
    {
    xlock( &mutex );
    while( num_free <= 0 ) xwait( &slot_av, &mutex );
    --num_free;
    xunlock( &mutex );
    }

  void leave_slot()				// return a slot to the tally
    {
    xlock( &mutex );
    ++num_free;
    xsignal( &slot_av );			// wake one waiter per slot freed
    xunlock( &mutex );
    }
  };


/* Single slot shared by all the workers of an operation. The first error
   stored wins; later ones are discarded. */
class First_error
  {
  Op_error error_;
  pthread_mutex_t mutex;

  First_error( const First_error & );		// declared as private
  void operator=( const First_error & );	// declared as private

public:
  First_error() { xinit_mutex( &mutex ); }
  ~First_error() { xdestroy_mutex( &mutex ); }

  // return true if this call stored the error
  bool set( const Error_kind kind, const int retval, const std::string & msg )
    {
    xlock( &mutex );
    const bool first = error_.ok();
    if( first ) error_.set( kind, retval, msg );
    xunlock( &mutex );
    return first;
    }

  Op_error get()
    { xlock( &mutex ); const Op_error e( error_ ); xunlock( &mutex );
      return e; }
  };
