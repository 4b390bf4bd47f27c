// *****************************************************************************
// * This file is part of the TransitFS project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef RETURN_CODES_H_8130748213705415
#define RETURN_CODES_H_8130748213705415


namespace tfs
{
enum TfsReturnCode //as returned after process exit
{
    TFS_RC_SUCCESS = 0,
    TFS_RC_ERROR,
    TFS_RC_SYNTAX_ERROR,
};


inline
void raiseReturnCode(TfsReturnCode& rc, TfsReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}
}

#endif //RETURN_CODES_H_8130748213705415
