#include <IcoDual/Types.hh>

// Points in error messages print as (x, y, z) at full precision.
Eigen::IOFormat pointFormatter(Eigen::FullPrecision, Eigen::DontAlignCols,
                               /* coeffSeparator */ ", ", /* rowSeparator */ ", ",
                               /* rowPrefix */ "", /* rowSuffix */ "",
                               /* matPrefix */ "(", /* matSuffix */ ")");
