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
#include <sys/stat.h>

#include "parzip.h"


/* Return the shortest name equivalent to path by purely lexical
   processing. Repeated slashes and '.' components are removed, and each
   '..' component removes the preceding non-'..' component. A '..' at the
   beginning of a rooted path is removed. The empty path becomes ".". */
std::string clean_path( const std::string & path )
  {
  if( path.empty() ) return ".";
  const bool rooted = path[0] == '/';
  std::vector< std::string > comps;
  unsigned i = 0;
  while( i < path.size() )
    {
    while( i < path.size() && path[i] == '/' ) ++i;
    const unsigned first = i;
    while( i < path.size() && path[i] != '/' ) ++i;
    if( first >= i ) break;
    const std::string comp( path, first, i - first );
    if( comp == "." ) continue;
    if( comp == ".." )
      {
      if( !comps.empty() && comps.back() != ".." ) comps.pop_back();
      else if( !rooted ) comps.push_back( comp );
      continue;
      }
    comps.push_back( comp );
    }
  std::string result( rooted ? "/" : "" );
  for( unsigned j = 0; j < comps.size(); ++j )
    { if( j > 0 ) result += '/'; result += comps[j]; }
  if( result.empty() ) result = ".";
  return result;
  }


// Return the last component of path, ignoring trailing slashes.
std::string base_name( const std::string & path )
  {
  int end = path.size();
  while( end > 1 && path[end-1] == '/' ) --end;
  int first = end;
  while( first > 0 && path[first-1] != '/' ) --first;
  if( first == end ) return end > 0 ? "/" : ".";
  return std::string( path, first, end - first );
  }


// Return all but the last component of path.
std::string dir_name( const std::string & path )
  {
  const std::string cpath( clean_path( path ) );
  const unsigned long i = cpath.rfind( '/' );
  if( i == std::string::npos ) return ".";
  if( i == 0 ) return "/";
  return cpath.substr( 0, i );
  }


/* Return true if target, after cleaning, is root itself or lies lexically
   below root. A relative root of "." contains every relative name that
   does not climb with "..". */
bool check_inside( const std::string & root, const std::string & target )
  {
  const std::string croot( clean_path( root ) );
  const std::string ctarget( clean_path( target ) );
  if( ctarget == croot ) return true;
  if( croot == "." )
    return ctarget[0] != '/' && ctarget != ".." &&
           ctarget.compare( 0, 3, "../" ) != 0;
  if( croot == "/" ) return ctarget[0] == '/';
  return ctarget.size() > croot.size() &&
         ctarget.compare( 0, croot.size(), croot ) == 0 &&
         ctarget[croot.size()] == '/';
  }


/* Join root and the untrusted entry name into target.
   Return 0 if target is inside root, else 2 with a message in estr. */
int gate_path( const std::string & root, const std::string & name,
               std::string & target, std::string & estr )
  {
  target = clean_path( root + '/' + name );
  if( check_inside( root, target ) ) return 0;
  format_file_error( estr, name.c_str(), escape_msg );
  return 2;
  }


// Create the missing parent directories of name.
bool make_dirs( const std::string & name )
  {
  int i = name.size();
  while( i > 0 && name[i-1] == '/' ) --i;	// remove trailing slashes
  while( i > 0 && name[i-1] != '/' ) --i;	// remove last component
  while( i > 0 && name[i-1] == '/' ) --i;	// remove more slashes
  const int dirsize = i;		// first slash before last component
  struct stat st;

  if( dirsize > 0 && stat( std::string( name, 0, dirsize ).c_str(), &st ) == 0 )
    { if( !S_ISDIR( st.st_mode ) ) { errno = ENOTDIR; return false; }
      return true; }
  for( i = 0; i < dirsize; )	// if dirsize == 0, dirname is '/' or empty
    {
    while( i < dirsize && name[i] == '/' ) ++i;
    const int first = i;
    while( i < dirsize && name[i] != '/' ) ++i;
    if( first < i )
      {
      const std::string partial( name, 0, i );
      const mode_t mode = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;
      if( stat( partial.c_str(), &st ) == 0 )
        { if( !S_ISDIR( st.st_mode ) ) { errno = ENOTDIR; return false; } }
      else if( mkdir( partial.c_str(), mode ) != 0 && errno != EEXIST )
        return false;	// if EEXIST, another thread or process created the dir
      }
    }
  return true;
  }


// Create dirname and its missing parents. Existing directories are fine.
bool make_dir_path( const std::string & dirname )
  {
  if( !make_dirs( dirname ) ) return false;
  const mode_t mode = S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH;
  if( mkdir( dirname.c_str(), mode ) == 0 ) return true;
  if( errno != EEXIST ) return false;
  struct stat st;
  if( stat( dirname.c_str(), &st ) == 0 && S_ISDIR( st.st_mode ) )
    return true;
  errno = ENOTDIR;
  return false;
  }


const char * remove_leading_dotslash( const char * const filename,
                                      std::string * const removed_prefixp,
                                      const bool dotdot )
  {
  const char * p = filename;

  if( dotdot )
    for( int i = 0; filename[i]; ++i )
      if( dotdot_at_i( filename, i ) ) p = filename + i + 2;
  while( *p == '/' || ( *p == '.' && p[1] == '/' ) ) ++p;
  if( p != filename ) removed_prefixp->assign( filename, p - filename );
  else removed_prefixp->clear();		// no prefix was removed
  if( *p == 0 && *filename != 0 ) p = ".";
  return p;
  }


mode_t get_umask()
  {
  static mode_t mask = 0;		// read once, cache the result
  static bool first_call = true;
  if( first_call ) { first_call = false; mask = umask( 0 ); umask( mask );
                     mask &= S_IRWXU | S_IRWXG | S_IRWXO; }
  return mask;
  }


void format_mode_string( const unsigned mode, char buf[mode_string_size] )
  {
  std::memcpy( buf, "----------", mode_string_size );
  if( S_ISDIR( mode ) ) buf[0] = 'd';
  else if( S_ISLNK( mode ) ) buf[0] = 'l';
  else if( !S_ISREG( mode ) && ( mode & S_IFMT ) ) buf[0] = '?';
  const bool setuid = mode & S_ISUID;
  const bool setgid = mode & S_ISGID;
  const bool sticky = mode & S_ISVTX;
  if( mode & S_IRUSR ) buf[1] = 'r';
  if( mode & S_IWUSR ) buf[2] = 'w';
  if( mode & S_IXUSR ) buf[3] = setuid ? 's' : 'x';
  else if( setuid ) buf[3] = 'S';
  if( mode & S_IRGRP ) buf[4] = 'r';
  if( mode & S_IWGRP ) buf[5] = 'w';
  if( mode & S_IXGRP ) buf[6] = setgid ? 's' : 'x';
  else if( setgid ) buf[6] = 'S';
  if( mode & S_IROTH ) buf[7] = 'r';
  if( mode & S_IWOTH ) buf[8] = 'w';
  if( mode & S_IXOTH ) buf[9] = sticky ? 't' : 'x';
  else if( sticky ) buf[9] = 'T';
  }
