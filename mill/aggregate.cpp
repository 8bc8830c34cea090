//    --------------------------------------------------------------------
//
//    This file is part of fmill.
//
//    fmill is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    fmill is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with fmill. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "mill/aggregate.h"
#include "mill/errors.h"

#include "helper/helper.h"

int fmill::set_summary_t::no_change( const metric_t m ) const
{
  std::map<metric_t,metric_tally_t>::const_iterator mm = by_metric.find( m );
  if ( mm == by_metric.end() ) return total;
  return total - mm->second.small - mm->second.large;
}

double fmill::set_summary_t::large_prop( const metric_t m ) const
{
  if ( total == 0 ) return 0;
  std::map<metric_t,metric_tally_t>::const_iterator mm = by_metric.find( m );
  if ( mm == by_metric.end() ) return 0;
  return mm->second.large / (double)total;
}

fmill::set_summary_t & fmill::set_summary_t::operator+=( const set_summary_t & rhs )
{
  if ( set_id == -1 )
    set_id = rhs.set_id;
  else if ( rhs.set_id != -1 && rhs.set_id != set_id )
    throw malformed_aggregate_error( "cannot combine sets " + Helper::int2str( set_id )
				     + " and " + Helper::int2str( rhs.set_id ) );

  total += rhs.total;
  small_changes += rhs.small_changes;
  large_changes += rhs.large_changes;
  changed_trials += rhs.changed_trials;
  large_trials += rhs.large_trials;
  large_cids.insert( rhs.large_cids.begin() , rhs.large_cids.end() );

  std::map<metric_t,metric_tally_t>::const_iterator mm = rhs.by_metric.begin();
  while ( mm != rhs.by_metric.end() )
    {
      by_metric[ mm->first ] += mm->second;
      ++mm;
    }

  return *this;
}


const std::map<std::string,double> & fmill::combo_record_t::series( const metric_t m ) const
{
  if ( m == TROUGHS ) return troughs;
  if ( m == SPEED ) return speed;
  return distance;
}

fmill::combo_record_t & fmill::combo_record_t::operator+=( const combo_record_t & rhs )
{
  if ( set_id == -1 )
    {
      set_id = rhs.set_id;
      combo_id = rhs.combo_id;
    }

  std::map<std::string,double>::const_iterator cc = rhs.troughs.begin();
  while ( cc != rhs.troughs.end() )
    {
      if ( troughs.count( cc->first ) )
	throw unknown_grouping_error( "chamber " + cc->first + " appears twice in set "
				      + Helper::int2str( set_id ) + " combo " + combo_id );
      ++cc;
    }

  troughs.insert( rhs.troughs.begin() , rhs.troughs.end() );
  speed.insert( rhs.speed.begin() , rhs.speed.end() );
  distance.insert( rhs.distance.begin() , rhs.distance.end() );
  labels.insert( rhs.labels.begin() , rhs.labels.end() );

  return *this;
}


void fmill::aggregator_t::add( const classified_trial_t & trial )
{

  const trial_id_t & id = trial.signal.id;

  if ( ! id.has_set() )
    throw unknown_grouping_error( trial.signal.name() + " has no set id" );

  if ( ! id.has_combo() )
    throw unknown_grouping_error( trial.signal.name() + " has no combo id" );

  // check before touching either map
  combo_key_t key( id.set_id , id.combo_id );
  std::map<combo_key_t,combo_record_t>::const_iterator ff = combos.find( key );
  if ( ff != combos.end() && ff->second.troughs.count( id.chamber_id ) )
    throw unknown_grouping_error( "chamber " + id.chamber_id + " appears twice in set "
				  + Helper::int2str( id.set_id ) + " combo " + id.combo_id );

  set_summary_t s;
  s.set_id = id.set_id;
  s.total = 1;
  s.small_changes = trial.changes.small_changes;
  s.large_changes = trial.changes.large_changes;
  s.changed_trials = trial.changes.small_changes + trial.changes.large_changes > 0 ? 1 : 0 ;
  s.large_trials = trial.changes.large_changes > 0 ? 1 : 0 ;
  s.large_cids = trial.changes.large_cids;

  std::map<metric_t,change_level_t>::const_iterator ll = trial.changes.level.begin();
  while ( ll != trial.changes.level.end() )
    {
      metric_tally_t & t = s.by_metric[ ll->first ];
      if ( ll->second == SMALL_CHANGE ) ++t.small;
      else if ( ll->second == LARGE_CHANGE ) ++t.large;
      ++ll;
    }

  combo_record_t c;
  c.set_id = id.set_id;
  c.combo_id = id.combo_id;
  c.troughs[ id.chamber_id ] = trial.record.troughs;
  c.speed[ id.chamber_id ] = trial.record.speed;
  c.distance[ id.chamber_id ] = trial.record.distance;
  if ( trial.signal.label != "" ) c.labels.insert( trial.signal.label );

  summaries[ id.set_id ] += s;
  combos[ key ] += c;

}


fmill::aggregator_t & fmill::aggregator_t::operator+=( const aggregator_t & rhs )
{

  // check before touching either map
  std::map<int,set_summary_t>::const_iterator ss = rhs.summaries.begin();
  while ( ss != rhs.summaries.end() )
    {
      std::map<int,set_summary_t>::const_iterator ff = summaries.find( ss->first );
      if ( ff != summaries.end() && ff->second.set_id != -1
	   && ss->second.set_id != -1 && ff->second.set_id != ss->second.set_id )
	throw malformed_aggregate_error( "cannot combine sets " + Helper::int2str( ff->second.set_id )
					 + " and " + Helper::int2str( ss->second.set_id ) );
      ++ss;
    }

  std::map<combo_key_t,combo_record_t>::const_iterator cc = rhs.combos.begin();
  while ( cc != rhs.combos.end() )
    {
      std::map<combo_key_t,combo_record_t>::const_iterator ff = combos.find( cc->first );
      if ( ff != combos.end() )
	{
	  std::map<std::string,double>::const_iterator tt = cc->second.troughs.begin();
	  while ( tt != cc->second.troughs.end() )
	    {
	      if ( ff->second.troughs.count( tt->first ) )
		throw unknown_grouping_error( "chamber " + tt->first + " appears twice in set "
					      + Helper::int2str( cc->first.first ) + " combo " + cc->first.second );
	      ++tt;
	    }
	}
      ++cc;
    }

  ss = rhs.summaries.begin();
  while ( ss != rhs.summaries.end() )
    {
      summaries[ ss->first ] += ss->second;
      ++ss;
    }

  cc = rhs.combos.begin();
  while ( cc != rhs.combos.end() )
    {
      combos[ cc->first ] += cc->second;
      ++cc;
    }

  return *this;
}


void fmill::aggregator_t::drop( const int set_id )
{
  summaries.erase( set_id );

  std::map<combo_key_t,combo_record_t>::iterator cc = combos.begin();
  while ( cc != combos.end() )
    {
      if ( cc->first.first == set_id )
	cc = combos.erase( cc );
      else
	++cc;
    }
}


fmill::aggregator_t fmill::aggregate( const std::vector<classified_trial_t> & trials )
{
  aggregator_t agg;
  for (int i=0; i<trials.size(); i++)
    agg.add( trials[i] );
  return agg;
}
